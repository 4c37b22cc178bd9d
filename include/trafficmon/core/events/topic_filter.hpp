#pragma once

#include <string>
#include <vector>

namespace TrafficMon {

// Rejects topics at or below any configured prefix. Immutable after construction.
class TopicFilter {
public:
    TopicFilter() = default;
    TopicFilter(const std::string& base_topic, bool ignore_bridge,
                std::vector<std::string> ignore_prefixes = {});

    bool accepts(const std::string& topic) const;
    const std::vector<std::string>& prefixes() const { return prefixes_; }

private:
    static bool matchesPrefix(const std::string& topic, const std::string& prefix);

    std::vector<std::string> prefixes_;
};

} // namespace TrafficMon
