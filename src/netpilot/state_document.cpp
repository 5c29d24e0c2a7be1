#include "netpilot/state_document.hpp"
#include "netpilot/errors.hpp"

#include <algorithm>
#include <ctime>

namespace netpilot {

using nlohmann::json;

namespace {

const json& require_member(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw InvalidFormatError(where + ": missing '" + key + "'");
    }
    return *it;
}

const json& require_object(const json& j, const char* key, const std::string& where) {
    const json& v = require_member(j, key, where);
    if (!v.is_object()) {
        throw InvalidFormatError(where + ": '" + key + "' is not an object");
    }
    return v;
}

std::vector<std::string> string_list(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<std::string>>();
}

} // namespace

PolicyGroup make_default_group(uint32_t reserved_class_id) {
    PolicyGroup group;
    group.group_id = kDefaultGroupId;
    group.name = kDefaultGroupName;
    group.active = true;
    group.bandwidth.allocation = ClassAllocation::for_number(reserved_class_id);
    return group;
}

RemoteStateDocument make_default_document(uint32_t first_class_id, uint32_t reserved_class_id) {
    RemoteStateDocument document;
    document.groups[kDefaultGroupId] = make_default_group(reserved_class_id);
    document.infrastructure.next_class_id = first_class_id;
    return document;
}

void to_json(json& j, const DeviceRef& d) {
    j = json{{"ip", d.ip}, {"mac", d.mac}};
}

void from_json(const json& j, DeviceRef& d) {
    d.ip = j.value("ip", "");
    d.mac = j.value("mac", "");
}

void to_json(json& j, const TimeBasedPolicy& p) {
    j = json{
        {"name", p.name},
        {"from", p.start_time},
        {"to", p.end_time},
        {"days", p.days},
        {"action", p.action},
        {"parameters", p.parameters},
        {"active", p.active},
    };
}

void from_json(const json& j, TimeBasedPolicy& p) {
    p.name = j.value("name", "");
    p.start_time = j.value("from", "");
    p.end_time = j.value("to", "");
    p.days = string_list(j, "days");
    p.action = j.value("action", "");
    p.parameters = j.value("parameters", json::object());
    p.active = j.value("active", true);
}

void to_json(json& j, const PolicyGroup& g) {
    json bandwidth = {
        {"limit_mbps", g.bandwidth.limit_mbps ? json(*g.bandwidth.limit_mbps) : json(nullptr)},
        {"tc_class", g.bandwidth.allocation ? json(g.bandwidth.allocation->tc_class_id) : json(nullptr)},
        {"mark_value", g.bandwidth.allocation ? json(g.bandwidth.allocation->mark_value) : json(nullptr)},
    };
    json access_control = {
        {"blocked_categories", g.access_control.blocked_categories},
        {"blocked_sites", g.access_control.blocked_sites},
        {"allowed_sites_only", g.access_control.allowed_sites_only},
        {"block_all_internet", g.access_control.block_all_internet},
    };
    j = json{
        {"name", g.name},
        {"active", g.active},
        {"device_count", g.devices.size()},
        {"devices", g.devices},
        {"policies", {
            {"bandwidth", bandwidth},
            {"access_control", access_control},
            {"time_based", g.time_based},
        }},
        {"infrastructure_created", g.infrastructure_created},
        {"last_sync", g.last_sync ? json(*g.last_sync) : json(nullptr)},
    };
}

void from_json(const json& j, PolicyGroup& g) {
    const std::string where = "group '" + std::to_string(g.group_id) + "'";
    if (!j.is_object()) {
        throw InvalidFormatError(where + " is not an object");
    }

    const json& name = require_member(j, "name", where);
    if (!name.is_string()) throw InvalidFormatError(where + ": 'name' is not a string");
    g.name = name.get<std::string>();

    const json& active = require_member(j, "active", where);
    if (!active.is_boolean()) throw InvalidFormatError(where + ": 'active' is not a boolean");
    g.active = active.get<bool>();

    const json& devices = require_member(j, "devices", where);
    if (!devices.is_array()) throw InvalidFormatError(where + ": 'devices' is not a list");
    g.devices.clear();
    for (const auto& d : devices) {
        if (!d.is_object()) throw InvalidFormatError(where + ": device entry is not an object");
        g.devices.push_back(d.get<DeviceRef>());
    }

    const json& policies = require_object(j, "policies", where);
    const json& bandwidth = require_object(policies, "bandwidth", where + " policies");
    const json& access = require_object(policies, "access_control", where + " policies");

    g.bandwidth = BandwidthPolicy();
    auto limit = bandwidth.find("limit_mbps");
    if (limit != bandwidth.end() && !limit->is_null()) {
        g.bandwidth.limit_mbps = limit->get<uint32_t>();
    }
    auto tc_class = bandwidth.find("tc_class");
    auto mark = bandwidth.find("mark_value");
    if (tc_class != bandwidth.end() && tc_class->is_string() && mark != bandwidth.end() && mark->is_number_integer()) {
        g.bandwidth.allocation = ClassAllocation{tc_class->get<std::string>(), mark->get<uint32_t>()};
    }

    g.access_control.blocked_categories = string_list(access, "blocked_categories");
    g.access_control.blocked_sites = string_list(access, "blocked_sites");
    g.access_control.allowed_sites_only = string_list(access, "allowed_sites_only");
    g.access_control.block_all_internet = access.value("block_all_internet", false);

    // Older documents carry a single {"from", "to"} object here.
    g.time_based.clear();
    auto time_based = policies.find("time_based");
    if (time_based != policies.end() && time_based->is_array()) {
        g.time_based = time_based->get<std::vector<TimeBasedPolicy>>();
    }

    g.infrastructure_created = j.value("infrastructure_created", false);
    auto last_sync = j.find("last_sync");
    if (last_sync != j.end() && last_sync->is_string()) {
        g.last_sync = last_sync->get<std::string>();
    } else {
        g.last_sync.reset();
    }
}

void to_json(json& j, const InfrastructureState& s) {
    j = json{
        {"base_setup_complete", s.base_setup_complete},
        {"available_class_pool", s.available_class_pool},
        {"next_class_id", s.next_class_id},
    };
}

void from_json(const json& j, InfrastructureState& s) {
    s.base_setup_complete = j.value("base_setup_complete", false);
    s.available_class_pool = j.value("available_class_pool", std::vector<uint32_t>());
    std::sort(s.available_class_pool.begin(), s.available_class_pool.end());
    s.available_class_pool.erase(std::unique(s.available_class_pool.begin(), s.available_class_pool.end()),
                                 s.available_class_pool.end());
    const json& next = require_member(j, "next_class_id", "infrastructure");
    if (!next.is_number_unsigned() && !next.is_number_integer()) {
        throw InvalidFormatError("infrastructure: 'next_class_id' is not an integer");
    }
    s.next_class_id = next.get<uint32_t>();
}

RemoteStateDocument parse_state_document(const std::string& text) {
    RemoteStateDocument document;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            throw InvalidFormatError("state document is not a JSON object");
        }

        document.version = root.value("version", kStateSchemaVersion);
        document.revision = root.value("revision", static_cast<uint64_t>(0));

        const json& groups = require_object(root, "groups", "state document");
        for (auto it = groups.begin(); it != groups.end(); ++it) {
            int group_id = 0;
            try {
                size_t consumed = 0;
                group_id = std::stoi(it.key(), &consumed);
                if (consumed != it.key().size()) throw std::invalid_argument(it.key());
            } catch (const std::logic_error&) {
                throw InvalidFormatError("group key '" + it.key() + "' is not an integer");
            }
            PolicyGroup group;
            group.group_id = group_id;
            from_json(it.value(), group);
            document.groups[group_id] = std::move(group);
        }

        if (document.groups.find(kDefaultGroupId) == document.groups.end()) {
            throw InvalidFormatError("group 0 is missing");
        }

        document.infrastructure = require_object(root, "infrastructure", "state document").get<InfrastructureState>();
    } catch (const json::exception& e) {
        throw InvalidFormatError(std::string("state document: ") + e.what());
    }
    return document;
}

std::string serialize_state_document(const RemoteStateDocument& document) {
    json groups = json::object();
    for (const auto& pair : document.groups) {
        groups[std::to_string(pair.first)] = pair.second;
    }
    json root = {
        {"version", document.version},
        {"revision", document.revision},
        {"groups", groups},
        {"infrastructure", document.infrastructure},
    };
    return root.dump(2);
}

std::string current_timestamp() {
    std::time_t t = std::time(nullptr);
    struct std::tm utc_tm;
    char buf[32];
    if (!gmtime_r(&t, &utc_tm) || !std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc_tm)) {
        return "";
    }
    return buf;
}

} // namespace netpilot
