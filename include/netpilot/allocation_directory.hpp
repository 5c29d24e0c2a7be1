#ifndef NETPILOT_ALLOCATION_DIRECTORY_HPP
#define NETPILOT_ALLOCATION_DIRECTORY_HPP

#include "netpilot/config_manager.hpp"
#include "netpilot/connection_pool.hpp"
#include "netpilot/logger.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace netpilot {

// Device endpoints taken from "device.<id>.host|port|username|identity_file".
class StaticAllocationDirectory : public ConnectionAllocator {
public:
    explicit StaticAllocationDirectory(PilotLogger& logger) : logger_(logger) {}

    // Returns the number of devices read; entries without a host are skipped.
    std::size_t load_from_config(const ConfigManager& config);

    void set_device(const std::string& device_id, ConnectionParams params);
    bool remove_device(const std::string& device_id);
    std::vector<std::string> device_ids() const;

    ConnectionParams resolve(const std::string& device_id) override;

private:
    PilotLogger& logger_;
    mutable std::mutex mutex_;
    std::map<std::string, ConnectionParams> devices_;
};

} // namespace netpilot

#endif // NETPILOT_ALLOCATION_DIRECTORY_HPP
