#ifndef NETPILOT_FIREWALL_LAYOUT_HPP
#define NETPILOT_FIREWALL_LAYOUT_HPP

#include "netpilot/config_manager.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace netpilot {

// Names and numbers of the scaffolding netpilot owns on a device.
struct FirewallLayout {
    std::string table = "mangle";
    std::string allow_chain = "NETPILOT_WHITELIST";
    std::string deny_chain = "NETPILOT_BLACKLIST";
    std::string groups_chain = "NETPILOT_GROUPS";
    std::string activation_hook = "FORWARD";
    // Every hook a mode chain may have been left on.
    std::vector<std::string> teardown_hooks = {"FORWARD", "INPUT", "OUTPUT", "PREROUTING", "POSTROUTING"};

    std::string unrestricted_class = "1:1";
    std::string limited_class = "1:10";
    uint32_t unrestricted_mark = 1;
    uint32_t limited_mark = 98;
    uint32_t unrestricted_filter_prio = 1;
    uint32_t limited_filter_prio = 2;
    uint32_t group_filter_prio = 3;

    std::string unrestricted_rate = "1000mbit";
    std::string limited_rate = "50mbit";

    // Scaffolding from the nftables-based releases.
    std::string legacy_nft_family = "inet";
    std::string legacy_nft_table = "netpilot";

    static FirewallLayout from_settings(const PilotSettings& settings) {
        FirewallLayout layout;
        layout.table = settings.firewall_table;
        layout.allow_chain = settings.allow_chain;
        layout.deny_chain = settings.deny_chain;
        layout.groups_chain = settings.groups_chain;
        layout.activation_hook = settings.activation_hook;
        layout.unrestricted_mark = settings.unrestricted_mark;
        layout.limited_mark = settings.limited_mark;
        layout.unrestricted_rate = settings.unrestricted_rate;
        layout.limited_rate = settings.limited_rate;
        return layout;
    }
};

// Parses `ls /sys/class/net`, dropping the loopback device.
inline std::vector<std::string> parse_interface_list(const std::string& listing) {
    std::vector<std::string> interfaces;
    std::istringstream iss(listing);
    std::string name;
    while (iss >> name) {
        if (name != "lo") {
            interfaces.push_back(name);
        }
    }
    return interfaces;
}

// Digits followed by a tc unit, e.g. "50mbit".
inline bool is_valid_rate(const std::string& rate) {
    size_t i = 0;
    while (i < rate.size() && rate[i] >= '0' && rate[i] <= '9') ++i;
    if (i == 0 || i == rate.size()) return false;
    for (; i < rate.size(); ++i) {
        char c = rate[i];
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) return false;
    }
    return true;
}

} // namespace netpilot

#endif // NETPILOT_FIREWALL_LAYOUT_HPP
