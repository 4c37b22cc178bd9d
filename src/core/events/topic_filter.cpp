#include <trafficmon/core/events/topic_filter.hpp>
#include <algorithm>
#include <utility>

namespace TrafficMon {

TopicFilter::TopicFilter(const std::string& base_topic, bool ignore_bridge,
                         std::vector<std::string> ignore_prefixes)
    : prefixes_(std::move(ignore_prefixes)) {
    if (ignore_bridge) {
        prefixes_.push_back(base_topic + "/bridge");
    }
    // Trailing slashes would break the segment-boundary check
    for (auto& p : prefixes_) {
        while (!p.empty() && p.back() == '/') p.pop_back();
    }
    prefixes_.erase(std::remove_if(prefixes_.begin(), prefixes_.end(),
                                   [](const std::string& p) { return p.empty(); }),
                    prefixes_.end());
}

bool TopicFilter::accepts(const std::string& topic) const {
    for (const auto& p : prefixes_) {
        if (matchesPrefix(topic, p)) return false;
    }
    return true;
}

bool TopicFilter::matchesPrefix(const std::string& topic, const std::string& prefix) {
    if (topic.size() < prefix.size()) return false;
    if (topic.compare(0, prefix.size(), prefix) != 0) return false;
    return topic.size() == prefix.size() || topic[prefix.size()] == '/';
}

} // namespace TrafficMon
