#ifndef NETPILOT_STATE_DOCUMENT_HPP
#define NETPILOT_STATE_DOCUMENT_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netpilot {

constexpr int kStateSchemaVersion = 1;
constexpr int kDefaultGroupId = 0;
constexpr const char* kDefaultGroupName = "Guest Group";

struct DeviceRef {
    std::string ip;
    std::string mac;

    bool operator==(const DeviceRef& other) const {
        return ip == other.ip && mac == other.mac;
    }
    bool operator!=(const DeviceRef& other) const { return !(*this == other); }
    bool operator<(const DeviceRef& other) const {
        if (mac != other.mac) return mac < other.mac;
        return ip < other.ip;
    }

    std::string to_string() const { return "{" + ip + ", " + mac + "}"; }
};

// Traffic-control class handle and the packet mark that feeds it. Class
// "1:N" always pairs with mark N.
struct ClassAllocation {
    std::string tc_class_id;
    uint32_t mark_value = 0;

    static ClassAllocation for_number(uint32_t number) {
        return {"1:" + std::to_string(number), number};
    }

    bool operator==(const ClassAllocation& other) const {
        return tc_class_id == other.tc_class_id && mark_value == other.mark_value;
    }
    bool operator!=(const ClassAllocation& other) const { return !(*this == other); }
};

struct BandwidthPolicy {
    std::optional<uint32_t> limit_mbps; // unset: unrestricted, no shaping rule
    std::optional<ClassAllocation> allocation;
};

struct AccessControlPolicy {
    std::vector<std::string> blocked_categories;
    std::vector<std::string> blocked_sites;
    std::vector<std::string> allowed_sites_only;
    bool block_all_internet = false;
};

// Schedule override stored with the group as given.
struct TimeBasedPolicy {
    std::string name;
    std::string start_time; // "HH:MM"
    std::string end_time;
    std::vector<std::string> days;
    std::string action;
    nlohmann::json parameters = nlohmann::json::object();
    bool active = true;
};

struct PolicyGroup {
    int group_id = 0;
    std::string name;
    bool active = true;
    std::vector<DeviceRef> devices;
    BandwidthPolicy bandwidth;
    AccessControlPolicy access_control;
    std::vector<TimeBasedPolicy> time_based;
    bool infrastructure_created = false;
    std::optional<std::string> last_sync;
};

struct InfrastructureState {
    bool base_setup_complete = false;
    std::vector<uint32_t> available_class_pool; // kept sorted
    uint32_t next_class_id = 101;
};

struct RemoteStateDocument {
    int version = kStateSchemaVersion;
    uint64_t revision = 0;
    std::map<int, PolicyGroup> groups;
    InfrastructureState infrastructure;

    const PolicyGroup* find_group(int group_id) const {
        auto it = groups.find(group_id);
        return it == groups.end() ? nullptr : &it->second;
    }
};

PolicyGroup make_default_group(uint32_t reserved_class_id);
RemoteStateDocument make_default_document(uint32_t first_class_id, uint32_t reserved_class_id);

// Throws InvalidFormatError naming the first structural problem: bad JSON,
// missing "groups" or "infrastructure", a malformed group, or no group 0.
RemoteStateDocument parse_state_document(const std::string& text);
std::string serialize_state_document(const RemoteStateDocument& document);

// UTC, "YYYY-MM-DDTHH:MM:SSZ".
std::string current_timestamp();

void to_json(nlohmann::json& j, const DeviceRef& d);
void from_json(const nlohmann::json& j, DeviceRef& d);
void to_json(nlohmann::json& j, const TimeBasedPolicy& p);
void from_json(const nlohmann::json& j, TimeBasedPolicy& p);
void to_json(nlohmann::json& j, const PolicyGroup& g);
void from_json(const nlohmann::json& j, PolicyGroup& g);
void to_json(nlohmann::json& j, const InfrastructureState& s);
void from_json(const nlohmann::json& j, InfrastructureState& s);

} // namespace netpilot

#endif // NETPILOT_STATE_DOCUMENT_HPP
