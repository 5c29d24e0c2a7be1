#include "netpilot/group_sync_service.hpp"
#include "netpilot/errors.hpp"

#include <mutex>
#include <set>

namespace netpilot {

GroupSyncService::GroupSyncService(PlanExecutor& executor, RemoteStateStore& store,
                                   InfrastructureReconciler& reconciler, FirewallLayout layout, PilotLogger& logger)
    : executor_(executor), store_(store), reconciler_(reconciler), layout_(std::move(layout)), logger_(logger) {}

std::vector<std::string> GroupSyncService::interfaces() {
    CommandOutput listing = executor_.run(Phase::ENSURE_STATE, ops::ListInterfaces{});
    return parse_interface_list(listing.output);
}

void GroupSyncService::plan_groups_chain(CommandPlan& plan) const {
    // Re-attach so the hook holds exactly one jump to the groups chain.
    plan.add(Phase::REBUILD, ops::CreateChain{layout_.table, layout_.groups_chain});
    plan.add(Phase::REBUILD, ops::DetachChain{layout_.table, layout_.activation_hook, layout_.groups_chain});
    plan.add(Phase::REBUILD, ops::AttachChain{layout_.table, layout_.activation_hook, layout_.groups_chain});
}

void GroupSyncService::plan_device_rules(CommandPlan& plan, Phase phase, RuleAction action, const DeviceRef& device,
                                         uint32_t mark) const {
    plan.add(phase, ops::MarkRule{action, layout_.table, layout_.groups_chain, 0, MatchKind::MAC_SOURCE,
                                  normalize_mac(device.mac), mark});
    plan.add(phase, ops::MarkRule{action, layout_.table, layout_.groups_chain, 0, MatchKind::IP_DESTINATION,
                                  device.ip, mark});
}

void GroupSyncService::plan_shaping_removal(CommandPlan& plan, const std::vector<std::string>& ifaces,
                                            const ClassAllocation& allocation) const {
    for (const auto& iface : ifaces) {
        plan.add(Phase::TEARDOWN, ops::MarkFilter{true, iface, layout_.group_filter_prio, allocation.mark_value,
                                                  allocation.tc_class_id});
        plan.add(Phase::TEARDOWN, ops::ShapingClass{ops::ClassAction::DELETE, iface, allocation.tc_class_id, ""});
    }
}

void GroupSyncService::plan_shaping_add(CommandPlan& plan, const std::vector<std::string>& ifaces,
                                        const ClassAllocation& allocation, const std::string& rate) const {
    for (const auto& iface : ifaces) {
        plan.add(Phase::REBUILD, ops::ShapingClass{ops::ClassAction::ADD, iface, allocation.tc_class_id, rate});
        plan.add(Phase::REBUILD, ops::MarkFilter{false, iface, layout_.group_filter_prio, allocation.mark_value,
                                                 allocation.tc_class_id});
    }
}

RouterCommandBundle GroupSyncService::sync_group(const GroupSyncRequest& request) {
    if (request.group_id < 0) {
        throw InvalidFormatError("Group id must not be negative: " + std::to_string(request.group_id));
    }
    if (request.bandwidth_limit_mbps && *request.bandwidth_limit_mbps == 0) {
        throw InvalidFormatError("Bandwidth limit must be at least 1 Mbit/s");
    }

    std::lock_guard<std::recursive_mutex> lock(store_.device_mutex());

    DeviceVerificationResult verification =
        store_.verify_devices(request.group_id, request.device_ips, request.device_macs);
    if (!verification.is_valid) {
        logger_.warning("GroupSyncService", "Group " + std::to_string(request.group_id) + " rejected: " +
                        verification.error_message);
        if (verification.error_kind == ErrorKind::DUPLICATE_DEVICE) {
            throw DuplicateDeviceError(verification.error_message, verification.conflicting_group.value_or(-1));
        }
        throw InvalidFormatError(verification.error_message);
    }

    RouterCommandBundle bundle;
    bundle.dry_run = request.dry_run;
    if (request.dry_run) {
        InfrastructureReport report = reconciler_.check_existing();
        for (auto component : report.missing) {
            bundle.warnings.push_back("would create " + component_to_string(component));
        }
        bundle.requires_restart = !report.all_satisfied;
    } else {
        bundle.merge(reconciler_.ensure(false).bundle);
    }

    const std::size_t mark = executor_.history_mark();
    RemoteStateDocument document = store_.load();
    const PolicyGroup* existing = document.find_group(request.group_id);
    const bool is_default = request.group_id == kDefaultGroupId;

    std::optional<ClassAllocation> old_allocation;
    std::optional<uint32_t> old_limit;
    std::vector<DeviceRef> old_devices;
    if (existing) {
        old_allocation = existing->bandwidth.allocation;
        old_limit = existing->bandwidth.limit_mbps;
        old_devices = existing->devices;
    }
    const std::optional<uint32_t> new_limit = request.bandwidth_limit_mbps;

    std::optional<ClassAllocation> new_allocation;
    if (is_default) {
        new_allocation = ClassAllocation::for_number(store_.options().reserved_class_id);
    } else if (new_limit) {
        new_allocation = old_allocation ? *old_allocation : store_.allocate_in(document);
    }

    const bool shaping_was = old_limit.has_value() && old_allocation.has_value();
    const bool shaping_now = new_limit.has_value() && new_allocation.has_value();
    const bool limit_changed = old_limit != new_limit;
    const bool full_rebuild = request.force_sync || !existing || limit_changed;

    std::vector<DeviceRef> devices;
    for (size_t i = 0; i < request.device_ips.size(); ++i) {
        devices.push_back({request.device_ips[i], normalize_mac(request.device_macs[i])});
    }

    std::vector<std::string> ifaces;
    if (shaping_was || shaping_now) {
        ifaces = interfaces();
    }

    CommandPlan plan;
    if (shaping_was) {
        const uint32_t old_mark = old_allocation->mark_value;
        if (full_rebuild || !shaping_now) {
            for (const auto& d : old_devices) {
                plan_device_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, d, old_mark);
            }
        } else {
            for (const auto& d : verification.delta.removed) {
                plan_device_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, d, old_mark);
            }
            for (const auto& change : verification.delta.ip_changed) {
                plan_device_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, change.first, old_mark);
            }
            for (const auto& change : verification.delta.mac_changed) {
                plan_device_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, change.first, old_mark);
            }
        }
        if (!shaping_now) {
            plan_shaping_removal(plan, ifaces, *old_allocation);
        }
    }

    if (shaping_now) {
        const uint32_t new_mark = new_allocation->mark_value;
        if (!shaping_was || request.force_sync) {
            plan_groups_chain(plan);
            plan_shaping_add(plan, ifaces, *new_allocation, rate_for(*new_limit));
        }
        if (full_rebuild || !shaping_was) {
            for (const auto& d : devices) {
                plan_device_rules(plan, Phase::REBUILD, RuleAction::APPEND, d, new_mark);
            }
        } else {
            for (const auto& d : verification.delta.added) {
                plan_device_rules(plan, Phase::REBUILD, RuleAction::APPEND, d, new_mark);
            }
            for (const auto& change : verification.delta.ip_changed) {
                plan_device_rules(plan, Phase::REBUILD, RuleAction::APPEND, change.second, new_mark);
            }
            for (const auto& change : verification.delta.mac_changed) {
                plan_device_rules(plan, Phase::REBUILD, RuleAction::APPEND, change.second, new_mark);
            }
        }
        if (shaping_was && (limit_changed || request.force_sync)) {
            for (const auto& iface : ifaces) {
                plan.add(Phase::APPLY_RATES, ops::ShapingClass{ops::ClassAction::CHANGE, iface,
                                                               new_allocation->tc_class_id, rate_for(*new_limit)});
            }
        }
    }

    if (request.dry_run) {
        bundle.add_all(plan);
        logger_.info("GroupSyncService", "Dry run for group " + std::to_string(request.group_id) + ": " +
                     std::to_string(plan.size()) + " commands planned");
        return bundle;
    }

    executor_.execute(plan);

    PolicyGroup group = existing ? *existing : PolicyGroup();
    group.group_id = request.group_id;
    if (!request.name.empty()) {
        group.name = request.name;
    } else if (group.name.empty()) {
        group.name = is_default ? kDefaultGroupName : "Group " + std::to_string(request.group_id);
    }
    group.active = request.active;
    group.devices = devices;
    group.bandwidth.limit_mbps = new_limit;
    group.bandwidth.allocation = new_allocation;
    group.access_control = request.access_control;
    group.time_based = request.time_based;
    group.infrastructure_created = shaping_now;
    group.last_sync = current_timestamp();
    document.groups[request.group_id] = group;

    if (old_allocation && !new_allocation) {
        store_.release_in(document, *old_allocation);
    }
    store_.save_document(document);

    bundle.add_all(executor_.history_since(mark));
    logger_.info("GroupSyncService", "Synced group " + std::to_string(request.group_id) + " (" +
                 std::to_string(devices.size()) + " devices, " +
                 (new_limit ? std::to_string(*new_limit) + " Mbit/s" : std::string("unlimited")) + ")");
    return bundle;
}

RouterCommandBundle GroupSyncService::remove_group(int group_id) {
    if (group_id == kDefaultGroupId) {
        throw ProtectedGroupError("Group 0 cannot be deleted");
    }

    std::lock_guard<std::recursive_mutex> lock(store_.device_mutex());
    RouterCommandBundle bundle;
    RemoteStateDocument document = store_.load();
    const PolicyGroup* group = document.find_group(group_id);
    if (!group) {
        bundle.warnings.push_back("group " + std::to_string(group_id) + " not present");
        return bundle;
    }

    const std::size_t mark = executor_.history_mark();
    const PolicyGroup* guest = document.find_group(kDefaultGroupId);
    const bool guest_shaped = guest && guest->bandwidth.limit_mbps && guest->bandwidth.allocation;
    const bool group_shaped = group->bandwidth.limit_mbps && group->bandwidth.allocation;

    std::vector<std::string> ifaces;
    if (group_shaped) {
        ifaces = interfaces();
    }

    CommandPlan plan;
    if (group_shaped) {
        for (const auto& d : group->devices) {
            plan_device_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, d, group->bandwidth.allocation->mark_value);
        }
        plan_shaping_removal(plan, ifaces, *group->bandwidth.allocation);
    }

    if (guest_shaped) {
        std::set<std::string> guest_macs;
        for (const auto& d : guest->devices) {
            guest_macs.insert(normalize_mac(d.mac));
        }
        bool chain_planned = false;
        for (const auto& d : group->devices) {
            if (guest_macs.count(normalize_mac(d.mac))) continue;
            if (!chain_planned) {
                plan_groups_chain(plan);
                chain_planned = true;
            }
            plan_device_rules(plan, Phase::REBUILD, RuleAction::APPEND, d, guest->bandwidth.allocation->mark_value);
        }
    }

    executor_.execute(plan);
    store_.delete_group(group_id);

    bundle.add_all(executor_.history_since(mark));
    logger_.info("GroupSyncService", "Removed group " + std::to_string(group_id));
    return bundle;
}

} // namespace netpilot
