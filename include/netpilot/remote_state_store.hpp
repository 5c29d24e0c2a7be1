#ifndef NETPILOT_REMOTE_STATE_STORE_HPP
#define NETPILOT_REMOTE_STATE_STORE_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/config_manager.hpp"
#include "netpilot/device_delta.hpp"
#include "netpilot/errors.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/state_document.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netpilot {

struct StateStoreOptions {
    std::string state_file_path = "/etc/config/netpilot_groups_state.json";
    uint32_t first_class_id = 101;
    uint32_t max_class_id = 999; // exclusive
    uint32_t reserved_class_id = 100;

    static StateStoreOptions from_settings(const PilotSettings& settings) {
        StateStoreOptions options;
        options.state_file_path = settings.state_file_path;
        options.first_class_id = settings.first_class_id;
        options.max_class_id = settings.max_class_id;
        options.reserved_class_id = settings.reserved_class_id;
        return options;
    }
};

struct DeviceVerificationResult {
    bool is_valid = false;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::optional<int> conflicting_group;
    bool group_exists = false;
    DeviceDelta delta;
};

// One in-process lock per device, shared by every store and service that
// mutates that device's document. Other processes are not covered.
class DeviceLockTable {
public:
    std::shared_ptr<std::recursive_mutex> lock_for(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[device_id];
        if (!slot) {
            slot = std::make_shared<std::recursive_mutex>();
        }
        return slot;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::recursive_mutex>> locks_;
};

// Policy state persisted as one JSON document on the device. Every call reads
// the document afresh; every mutation rewrites it whole.
class RemoteStateStore {
public:
    RemoteStateStore(CommandRunner& runner, StateStoreOptions options, PilotLogger& logger,
                     std::shared_ptr<std::recursive_mutex> device_lock = nullptr);

    // Self-healing: an absent, unreadable or malformed document is replaced by
    // the default one, which is written back before returning.
    RemoteStateDocument load();

    // Overwrites the document with defaults.
    RemoteStateDocument reset_to_default();

    // Applies `mutation` to a freshly loaded document and writes it back.
    RemoteStateDocument update(const std::function<void(RemoteStateDocument&)>& mutation);

    void save_group(const PolicyGroup& group);

    // Throws ProtectedGroupError for group 0. Devices of the deleted group move
    // to group 0. Returns false if the group did not exist.
    bool delete_group(int group_id);

    // Throws PoolExhaustedError once the counter reaches the ceiling and the
    // pool is empty.
    ClassAllocation allocate_class();

    // Returns false when nothing changed: already available, reserved for
    // group 0, out of range, or still assigned to a group.
    bool release_class(const ClassAllocation& allocation);

    DeviceVerificationResult verify_devices(int group_id, const std::vector<DeviceRef>& devices);
    DeviceVerificationResult verify_devices(int group_id, const std::vector<std::string>& ips,
                                            const std::vector<std::string>& macs);

    // Diff only; no validation.
    DeviceDelta get_device_changes(int group_id, const std::vector<DeviceRef>& devices);

    std::optional<PolicyGroup> get_group(int group_id);
    std::vector<PolicyGroup> list_groups();
    void mark_base_setup_complete(bool complete);

    // Writes a document obtained from load(); bumps its revision.
    void save_document(RemoteStateDocument& document);

    // Held across a multi-step read-modify-write.
    std::recursive_mutex& device_mutex() const { return *device_lock_; }

    const StateStoreOptions& options() const { return options_; }

    // Document-level helpers, also used by GroupSyncService inside update().
    ClassAllocation allocate_in(RemoteStateDocument& document) const;
    bool release_in(RemoteStateDocument& document, const ClassAllocation& allocation) const;

private:
    void write(RemoteStateDocument& document);
    RemoteStateDocument load_locked();

    CommandRunner& runner_;
    StateStoreOptions options_;
    PilotLogger& logger_;
    std::shared_ptr<std::recursive_mutex> device_lock_;
};

} // namespace netpilot

#endif // NETPILOT_REMOTE_STATE_STORE_HPP
