#include <trafficmon/core/events/topic_key.hpp>
#include <algorithm>
#include <vector>

namespace TrafficMon {

std::string extractDisplayKey(const std::string& topic, int detail_depth) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = topic.find('/', start);
        if (pos == std::string::npos) {
            parts.emplace_back(topic.substr(start));
            break;
        }
        parts.emplace_back(topic.substr(start, pos - start));
        start = pos + 1;
    }

    // Segments [1, min(parts, depth + 1)) survive; segment 0 is the namespace
    size_t end = std::min(parts.size(), static_cast<size_t>(std::max(detail_depth, 0)) + 1);

    std::string key;
    for (size_t i = 1; i < end; ++i) {
        if (i > 1) key.push_back('/');
        key += parts[i];
    }

    if (key.empty()) return topic;
    return key;
}

} // namespace TrafficMon
