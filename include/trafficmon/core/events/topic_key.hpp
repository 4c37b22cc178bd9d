#pragma once

#include <string>

namespace TrafficMon {

/**
 * @brief Map a full topic path to its display key.
 *
 * The first segment is the namespace and is dropped; up to @p detail_depth
 * segments after it are joined with '/'. A topic with nothing after the
 * namespace maps to itself.
 *
 *   extractDisplayKey("zigbee2mqtt/bridge/state", 1) == "bridge"
 *   extractDisplayKey("zigbee2mqtt/bridge/state", 2) == "bridge/state"
 *   extractDisplayKey("zigbee2mqtt", 1)              == "zigbee2mqtt"
 */
std::string extractDisplayKey(const std::string& topic, int detail_depth);

} // namespace TrafficMon
