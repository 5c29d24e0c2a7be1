#include "netpilot/remote_state_store.hpp"

#include <algorithm>
#include <set>

namespace netpilot {

RemoteStateStore::RemoteStateStore(CommandRunner& runner, StateStoreOptions options, PilotLogger& logger,
                                   std::shared_ptr<std::recursive_mutex> device_lock)
    : runner_(runner), options_(std::move(options)), logger_(logger),
      device_lock_(device_lock ? std::move(device_lock) : std::make_shared<std::recursive_mutex>()) {}

RemoteStateDocument RemoteStateStore::load() {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    return load_locked();
}

RemoteStateDocument RemoteStateStore::load_locked() {
    CommandOutput result = runner_.run(render(ops::ReadFile{options_.state_file_path}));

    std::string reason;
    if (result.output.find_first_not_of(" \t\r\n") == std::string::npos) {
        reason = result.error_output.empty() ? "empty" : PilotLogger::excerpt(result.error_output, 120);
    } else {
        try {
            RemoteStateDocument document = parse_state_document(result.output);
            if (document.version > kStateSchemaVersion) {
                logger_.warning("RemoteStateStore", "State document version " + std::to_string(document.version) +
                                " is newer than supported version " + std::to_string(kStateSchemaVersion));
            }
            return document;
        } catch (const InvalidFormatError& e) {
            reason = e.what();
        }
    }

    logger_.warning("RemoteStateStore", "State document at " + options_.state_file_path +
                    " unusable (" + reason + "), writing defaults");
    RemoteStateDocument document = make_default_document(options_.first_class_id, options_.reserved_class_id);
    write(document);
    return document;
}

void RemoteStateStore::write(RemoteStateDocument& document) {
    document.version = kStateSchemaVersion;
    document.revision++;
    const ops::WriteFile write_op{options_.state_file_path, serialize_state_document(document)};

    CommandOutput result = runner_.run(render(write_op), stdin_payload(write_op));
    // Only the confirmation line proves the rename happened.
    const bool confirmed = result.exit_status == 0 &&
                           result.output.find(ops::WriteFile::kConfirmation) != std::string::npos &&
                           result.error_output.find_first_not_of(" \t\r\n") == std::string::npos;
    if (!confirmed) {
        std::string reason = result.error_output.find_first_not_of(" \t\r\n") != std::string::npos
                                 ? PilotLogger::excerpt(result.error_output)
                                 : "exit status " + std::to_string(result.exit_status) + ", no confirmation";
        logger_.error("RemoteStateStore", "Writing state document (" + std::to_string(write_op.content.size()) +
                      " bytes) failed: " + reason);
        throw CommandFailureError(phase_to_string(Phase::ENSURE_STATE),
                                  "write " + options_.state_file_path, reason);
    }
    logger_.debug("RemoteStateStore", "State document written, revision " + std::to_string(document.revision));
}

void RemoteStateStore::save_document(RemoteStateDocument& document) {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    write(document);
}

RemoteStateDocument RemoteStateStore::reset_to_default() {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    RemoteStateDocument document = make_default_document(options_.first_class_id, options_.reserved_class_id);
    write(document);
    logger_.info("RemoteStateStore", "State document reset to defaults");
    return document;
}

RemoteStateDocument RemoteStateStore::update(const std::function<void(RemoteStateDocument&)>& mutation) {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    RemoteStateDocument document = load_locked();
    mutation(document);
    write(document);
    return document;
}

void RemoteStateStore::save_group(const PolicyGroup& group) {
    if (group.group_id == kDefaultGroupId &&
        group.bandwidth.allocation != ClassAllocation::for_number(options_.reserved_class_id)) {
        throw ProtectedGroupError("Group 0 must keep its reserved class " +
                                  ClassAllocation::for_number(options_.reserved_class_id).tc_class_id);
    }
    update([&](RemoteStateDocument& document) {
        document.groups[group.group_id] = group;
    });
    logger_.info("RemoteStateStore", "Saved group " + std::to_string(group.group_id) + " (" +
                 std::to_string(group.devices.size()) + " devices)");
}

bool RemoteStateStore::delete_group(int group_id) {
    if (group_id == kDefaultGroupId) {
        throw ProtectedGroupError("Group 0 cannot be deleted");
    }

    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    RemoteStateDocument document = load_locked();
    auto it = document.groups.find(group_id);
    if (it == document.groups.end()) {
        logger_.info("RemoteStateStore", "Group " + std::to_string(group_id) + " not present, nothing to delete");
        return false;
    }

    PolicyGroup removed = std::move(it->second);
    document.groups.erase(it);

    PolicyGroup& guest = document.groups[kDefaultGroupId];
    std::set<std::string> guest_macs;
    for (const auto& d : guest.devices) {
        guest_macs.insert(normalize_mac(d.mac));
    }
    size_t moved = 0;
    for (const auto& d : removed.devices) {
        if (guest_macs.insert(normalize_mac(d.mac)).second) {
            guest.devices.push_back(d);
            moved++;
        }
    }

    if (removed.bandwidth.allocation) {
        release_in(document, *removed.bandwidth.allocation);
    }

    write(document);
    logger_.info("RemoteStateStore", "Deleted group " + std::to_string(group_id) + ", moved " +
                 std::to_string(moved) + " devices to group 0");
    return true;
}

ClassAllocation RemoteStateStore::allocate_in(RemoteStateDocument& document) const {
    InfrastructureState& infra = document.infrastructure;
    if (!infra.available_class_pool.empty()) {
        uint32_t id = infra.available_class_pool.front();
        infra.available_class_pool.erase(infra.available_class_pool.begin());
        return ClassAllocation::for_number(id);
    }
    if (infra.next_class_id < options_.first_class_id) {
        infra.next_class_id = options_.first_class_id;
    }
    if (infra.next_class_id >= options_.max_class_id) {
        throw PoolExhaustedError("No traffic-control classes left (ceiling " +
                                 std::to_string(options_.max_class_id) + "); delete unused groups");
    }
    return ClassAllocation::for_number(infra.next_class_id++);
}

bool RemoteStateStore::release_in(RemoteStateDocument& document, const ClassAllocation& allocation) const {
    const uint32_t id = allocation.mark_value;
    if (id == options_.reserved_class_id) {
        logger_.warning("RemoteStateStore", "Refusing to release group 0's reserved class " + allocation.tc_class_id);
        return false;
    }
    if (id < options_.first_class_id || id >= options_.max_class_id) {
        logger_.warning("RemoteStateStore", "Class " + allocation.tc_class_id + " is outside the managed range");
        return false;
    }
    for (const auto& pair : document.groups) {
        if (pair.second.bandwidth.allocation && pair.second.bandwidth.allocation->mark_value == id) {
            logger_.warning("RemoteStateStore", "Class " + allocation.tc_class_id + " still assigned to group " +
                            std::to_string(pair.first));
            return false;
        }
    }

    InfrastructureState& infra = document.infrastructure;
    if (id >= infra.next_class_id ||
        std::binary_search(infra.available_class_pool.begin(), infra.available_class_pool.end(), id)) {
        return false;
    }

    if (id + 1 == infra.next_class_id) {
        // Most recently minted: give it back to the counter, then fold any
        // pooled ids that now sit directly below it.
        infra.next_class_id--;
        while (!infra.available_class_pool.empty() && infra.available_class_pool.back() + 1 == infra.next_class_id) {
            infra.available_class_pool.pop_back();
            infra.next_class_id--;
        }
    } else {
        infra.available_class_pool.insert(
            std::lower_bound(infra.available_class_pool.begin(), infra.available_class_pool.end(), id), id);
    }
    return true;
}

ClassAllocation RemoteStateStore::allocate_class() {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    RemoteStateDocument document = load_locked();
    ClassAllocation allocation = allocate_in(document);
    write(document);
    logger_.debug("RemoteStateStore", "Allocated class " + allocation.tc_class_id);
    return allocation;
}

bool RemoteStateStore::release_class(const ClassAllocation& allocation) {
    std::lock_guard<std::recursive_mutex> lock(*device_lock_);
    RemoteStateDocument document = load_locked();
    if (!release_in(document, allocation)) {
        return false;
    }
    write(document);
    logger_.debug("RemoteStateStore", "Released class " + allocation.tc_class_id);
    return true;
}

DeviceVerificationResult RemoteStateStore::verify_devices(int group_id, const std::vector<DeviceRef>& devices) {
    DeviceVerificationResult result;

    for (const auto& d : devices) {
        if (!is_valid_ip(d.ip)) {
            result.error_kind = ErrorKind::INVALID_FORMAT;
            result.error_message = "Invalid IP address: '" + d.ip + "'";
            return result;
        }
        if (!is_valid_mac(d.mac)) {
            result.error_kind = ErrorKind::INVALID_FORMAT;
            result.error_message = "Invalid MAC address: '" + d.mac + "'";
            return result;
        }
    }

    std::set<std::string> seen_ips;
    std::set<std::string> seen_macs;
    for (const auto& d : devices) {
        if (!seen_ips.insert(d.ip).second || !seen_macs.insert(normalize_mac(d.mac)).second) {
            result.error_kind = ErrorKind::DUPLICATE_DEVICE;
            result.error_message = "Device " + d.to_string() + " is listed twice for group " + std::to_string(group_id);
            result.conflicting_group = group_id;
            return result;
        }
    }

    RemoteStateDocument document = load();

    for (const auto& pair : document.groups) {
        if (pair.first == group_id) continue;
        for (const auto& stored : pair.second.devices) {
            for (const auto& d : devices) {
                bool ip_clash = stored.ip == d.ip;
                bool mac_clash = normalize_mac(stored.mac) == normalize_mac(d.mac);
                if (ip_clash || mac_clash) {
                    result.error_kind = ErrorKind::DUPLICATE_DEVICE;
                    result.error_message = std::string(mac_clash ? "MAC " + d.mac : "IP " + d.ip) +
                                           " already belongs to group " + std::to_string(pair.first) +
                                           " (" + pair.second.name + ")";
                    result.conflicting_group = pair.first;
                    return result;
                }
            }
        }
    }

    const PolicyGroup* existing = document.find_group(group_id);
    result.group_exists = existing != nullptr;
    if (existing) {
        result.delta = compute_device_delta(existing->devices, devices);
    } else {
        result.delta.added = devices;
    }
    result.is_valid = true;
    return result;
}

DeviceVerificationResult RemoteStateStore::verify_devices(int group_id, const std::vector<std::string>& ips,
                                                          const std::vector<std::string>& macs) {
    if (ips.size() != macs.size()) {
        DeviceVerificationResult result;
        result.error_kind = ErrorKind::INVALID_FORMAT;
        result.error_message = "Got " + std::to_string(ips.size()) + " IP addresses but " +
                               std::to_string(macs.size()) + " MAC addresses";
        return result;
    }
    std::vector<DeviceRef> devices;
    devices.reserve(ips.size());
    for (size_t i = 0; i < ips.size(); ++i) {
        devices.push_back({ips[i], macs[i]});
    }
    return verify_devices(group_id, devices);
}

DeviceDelta RemoteStateStore::get_device_changes(int group_id, const std::vector<DeviceRef>& devices) {
    RemoteStateDocument document = load();
    const PolicyGroup* existing = document.find_group(group_id);
    if (!existing) {
        DeviceDelta delta;
        delta.added = devices;
        return delta;
    }
    return compute_device_delta(existing->devices, devices);
}

std::optional<PolicyGroup> RemoteStateStore::get_group(int group_id) {
    RemoteStateDocument document = load();
    const PolicyGroup* group = document.find_group(group_id);
    if (!group) {
        return std::nullopt;
    }
    return *group;
}

std::vector<PolicyGroup> RemoteStateStore::list_groups() {
    RemoteStateDocument document = load();
    std::vector<PolicyGroup> groups;
    for (const auto& pair : document.groups) {
        groups.push_back(pair.second);
    }
    return groups;
}

void RemoteStateStore::mark_base_setup_complete(bool complete) {
    update([complete](RemoteStateDocument& document) {
        document.infrastructure.base_setup_complete = complete;
    });
}

} // namespace netpilot
