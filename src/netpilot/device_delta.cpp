#include "netpilot/device_delta.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <map>

namespace netpilot {

bool is_valid_ip(const std::string& ip) {
    unsigned char buf[16];
    if (ip.empty()) return false;
    return inet_pton(AF_INET, ip.c_str(), buf) == 1 || inet_pton(AF_INET6, ip.c_str(), buf) == 1;
}

bool is_valid_mac(const std::string& mac) {
    if (mac.size() != 17) return false;
    const char sep = mac[2];
    if (sep != ':' && sep != '-') return false;
    for (size_t i = 0; i < mac.size(); ++i) {
        if (i % 3 == 2) {
            if (mac[i] != sep) return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(mac[i]))) {
            return false;
        }
    }
    return true;
}

std::string normalize_mac(const std::string& mac) {
    std::string out = mac;
    for (char& c : out) {
        if (c == '-') {
            c = ':';
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

DeviceDelta compute_device_delta(const std::vector<DeviceRef>& stored, const std::vector<DeviceRef>& incoming) {
    DeviceDelta delta;

    std::map<std::string, size_t> stored_by_mac;
    std::map<std::string, size_t> stored_by_ip;
    for (size_t i = 0; i < stored.size(); ++i) {
        stored_by_mac.emplace(normalize_mac(stored[i].mac), i);
        stored_by_ip.emplace(stored[i].ip, i);
    }

    // A stored device pairs with at most one incoming device. Every MAC match
    // is taken before any IP match, so the result does not depend on the
    // order of the incoming list.
    std::vector<bool> paired(stored.size(), false);
    std::vector<bool> matched(incoming.size(), false);

    for (size_t i = 0; i < incoming.size(); ++i) {
        const DeviceRef& device = incoming[i];
        auto by_mac = stored_by_mac.find(normalize_mac(device.mac));
        if (by_mac == stored_by_mac.end() || paired[by_mac->second]) continue;
        const DeviceRef& old = stored[by_mac->second];
        paired[by_mac->second] = true;
        matched[i] = true;
        if (old.ip == device.ip) {
            delta.unchanged.push_back(device);
        } else {
            delta.ip_changed.emplace_back(old, device);
        }
    }

    for (size_t i = 0; i < incoming.size(); ++i) {
        if (matched[i]) continue;
        const DeviceRef& device = incoming[i];
        auto by_ip = stored_by_ip.find(device.ip);
        if (by_ip != stored_by_ip.end() && !paired[by_ip->second]) {
            paired[by_ip->second] = true;
            delta.mac_changed.emplace_back(stored[by_ip->second], device);
        } else {
            delta.added.push_back(device);
        }
    }

    for (size_t i = 0; i < stored.size(); ++i) {
        if (!paired[i]) {
            delta.removed.push_back(stored[i]);
        }
    }
    return delta;
}

} // namespace netpilot
