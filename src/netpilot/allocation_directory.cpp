#include "netpilot/allocation_directory.hpp"
#include "netpilot/errors.hpp"

#include <set>

namespace netpilot {

std::size_t StaticAllocationDirectory::load_from_config(const ConfigManager& config) {
    std::map<std::string, ConfigValue> section = config.get_section("device");

    std::set<std::string> ids;
    for (const auto& pair : section) {
        size_t dot = pair.first.find('.');
        if (dot != std::string::npos && dot > 0) {
            ids.insert(pair.first.substr(0, dot));
        }
    }

    std::size_t loaded = 0;
    for (const auto& id : ids) {
        const std::string prefix = "device." + id + ".";
        std::optional<std::string> host = config.get_string(prefix + "host");
        if (!host || host->empty()) {
            logger_.warning("AllocationDirectory", "Device '" + id + "' has no host, skipped");
            continue;
        }

        ConnectionParams params;
        params.host = *host;
        if (auto port = config.get_unsigned(prefix + "port")) {
            params.port = static_cast<uint16_t>(*port);
        }
        params.username = config.get_string(prefix + "username").value_or("root");
        params.credential = config.get_string(prefix + "identity_file").value_or("");

        set_device(id, std::move(params));
        loaded++;
    }
    logger_.info("AllocationDirectory", "Loaded " + std::to_string(loaded) + " device endpoints");
    return loaded;
}

void StaticAllocationDirectory::set_device(const std::string& device_id, ConnectionParams params) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device_id] = std::move(params);
}

bool StaticAllocationDirectory::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.erase(device_id) > 0;
}

std::vector<std::string> StaticAllocationDirectory::device_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& pair : devices_) {
        ids.push_back(pair.first);
    }
    return ids;
}

ConnectionParams StaticAllocationDirectory::resolve(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        throw ConnectionError("No endpoint allocated for device '" + device_id + "'");
    }
    return it->second;
}

} // namespace netpilot
