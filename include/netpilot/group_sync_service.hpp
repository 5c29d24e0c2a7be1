#ifndef NETPILOT_GROUP_SYNC_SERVICE_HPP
#define NETPILOT_GROUP_SYNC_SERVICE_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/firewall_layout.hpp"
#include "netpilot/infrastructure_reconciler.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/router_command_bundle.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netpilot {

// Desired state of one group as handed in by the policy layer.
struct GroupSyncRequest {
    int group_id = 0;
    std::string name;
    std::vector<std::string> device_ips;
    std::vector<std::string> device_macs; // parallel to device_ips
    std::optional<uint32_t> bandwidth_limit_mbps;
    AccessControlPolicy access_control;
    std::vector<TimeBasedPolicy> time_based;
    bool active = true;
    bool force_sync = false; // rebuild every rule instead of applying the delta
    bool dry_run = false;    // plan only; nothing is executed or saved
};

// Pushes a group's membership and bandwidth limit to the device: a shaping
// class with a mark filter per interface, and per-device mark rules in the
// groups chain.
class GroupSyncService {
public:
    GroupSyncService(PlanExecutor& executor, RemoteStateStore& store, InfrastructureReconciler& reconciler,
                     FirewallLayout layout, PilotLogger& logger);

    // Throws InvalidFormatError or DuplicateDeviceError before any remote
    // change when the device list does not verify.
    RouterCommandBundle sync_group(const GroupSyncRequest& request);

    // Throws ProtectedGroupError for group 0. Devices move to group 0 and pick
    // up its limit, if it has one.
    RouterCommandBundle remove_group(int group_id);

private:
    void plan_groups_chain(CommandPlan& plan) const;
    void plan_device_rules(CommandPlan& plan, Phase phase, RuleAction action, const DeviceRef& device,
                           uint32_t mark) const;
    void plan_shaping_removal(CommandPlan& plan, const std::vector<std::string>& interfaces,
                              const ClassAllocation& allocation) const;
    void plan_shaping_add(CommandPlan& plan, const std::vector<std::string>& interfaces,
                          const ClassAllocation& allocation, const std::string& rate) const;
    std::vector<std::string> interfaces();

    static std::string rate_for(uint32_t limit_mbps) { return std::to_string(limit_mbps) + "mbit"; }

    PlanExecutor& executor_;
    RemoteStateStore& store_;
    InfrastructureReconciler& reconciler_;
    FirewallLayout layout_;
    PilotLogger& logger_;
};

} // namespace netpilot

#endif // NETPILOT_GROUP_SYNC_SERVICE_HPP
