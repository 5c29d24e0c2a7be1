#ifndef NETPILOT_DEVICE_DELTA_HPP
#define NETPILOT_DEVICE_DELTA_HPP

#include "netpilot/state_document.hpp"

#include <string>
#include <utility>
#include <vector>

namespace netpilot {

// Result of diffing an incoming device list against a stored one. Changed
// entries are (stored, incoming) pairs.
struct DeviceDelta {
    std::vector<DeviceRef> added;
    std::vector<DeviceRef> removed;
    std::vector<std::pair<DeviceRef, DeviceRef>> ip_changed;
    std::vector<std::pair<DeviceRef, DeviceRef>> mac_changed;
    std::vector<DeviceRef> unchanged;

    bool has_changes() const {
        return !added.empty() || !removed.empty() || !ip_changed.empty() || !mac_changed.empty();
    }
};

DeviceDelta compute_device_delta(const std::vector<DeviceRef>& stored, const std::vector<DeviceRef>& incoming);

// IPv4 dotted quad or IPv6.
bool is_valid_ip(const std::string& ip);
// Six hex pairs separated by ':' or '-'.
bool is_valid_mac(const std::string& mac);
// Lower-case, colon separated.
std::string normalize_mac(const std::string& mac);

} // namespace netpilot

#endif // NETPILOT_DEVICE_DELTA_HPP
