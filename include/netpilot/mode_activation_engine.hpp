#ifndef NETPILOT_MODE_ACTIVATION_ENGINE_HPP
#define NETPILOT_MODE_ACTIVATION_ENGINE_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/firewall_layout.hpp"
#include "netpilot/infrastructure_reconciler.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/router_command_bundle.hpp"

#include <map>
#include <string>
#include <vector>

namespace netpilot {

enum class ActiveMode {
    NONE,
    ALLOW_LIST,
    DENY_LIST
};

std::string active_mode_to_string(ActiveMode mode);

struct ModeValidation {
    ActiveMode mode = ActiveMode::NONE;
    // hook -> netpilot mode chains attached to it
    std::map<std::string, std::vector<std::string>> attachments;
    bool consistent = true;
    std::vector<std::string> problems;
};

// Moves a device between disabled, allow-list and deny-list postures by
// tearing everything down and rebuilding the target chain from the stored
// membership. Between teardown and activation the device forwards without
// netpilot classification.
class ModeActivationEngine {
public:
    ModeActivationEngine(PlanExecutor& executor, RemoteStateStore& store, InfrastructureReconciler& reconciler,
                         FirewallLayout layout, PilotLogger& logger);

    // Both activations first create any missing scaffolding, shaping
    // classes included.
    // Members of `group_id` are unrestricted; everything else is limited.
    RouterCommandBundle activate_allow_list(int group_id);
    // Members of `group_id` are limited; everything else is unrestricted.
    RouterCommandBundle activate_deny_list(int group_id);
    RouterCommandBundle deactivate();

    // Read from the activation hook on the device, never cached.
    ActiveMode get_active_mode();
    ModeValidation validate_mode();

    // Single-device changes to the chain of the active mode; no teardown.
    RouterCommandBundle add_device_to_active_list(const DeviceRef& device);
    RouterCommandBundle remove_device_from_active_list(const DeviceRef& device);

    // Changes the two standard shaping classes on every interface.
    RouterCommandBundle update_rates(const std::string& unrestricted_rate, const std::string& limited_rate);

    const FirewallLayout& layout() const { return layout_; }

private:
    RouterCommandBundle activate(ActiveMode mode, int group_id);
    void plan_teardown(CommandPlan& plan) const;
    void plan_member_rules(CommandPlan& plan, Phase phase, RuleAction action, const std::string& chain,
                           const DeviceRef& device, uint32_t mark, uint32_t& position) const;
    void plan_rates(CommandPlan& plan, const std::vector<std::string>& interfaces,
                    const std::string& unrestricted_rate, const std::string& limited_rate) const;
    std::vector<std::string> attached_mode_chains(const std::string& hook);
    const std::string& chain_for(ActiveMode mode) const;
    uint32_t member_mark(ActiveMode mode) const;

    PlanExecutor& executor_;
    RemoteStateStore& store_;
    InfrastructureReconciler& reconciler_;
    FirewallLayout layout_;
    PilotLogger& logger_;
};

} // namespace netpilot

#endif // NETPILOT_MODE_ACTIVATION_ENGINE_HPP
