#include "netpilot/mode_activation_engine.hpp"
#include "netpilot/device_delta.hpp"
#include "netpilot/errors.hpp"

#include <algorithm>
#include <sstream>

namespace netpilot {

std::string active_mode_to_string(ActiveMode mode) {
    switch (mode) {
        case ActiveMode::NONE:       return "none";
        case ActiveMode::ALLOW_LIST: return "allow_list";
        case ActiveMode::DENY_LIST:  return "deny_list";
        default:                     return "unknown";
    }
}

ModeActivationEngine::ModeActivationEngine(PlanExecutor& executor, RemoteStateStore& store,
                                           InfrastructureReconciler& reconciler, FirewallLayout layout,
                                           PilotLogger& logger)
    : executor_(executor), store_(store), reconciler_(reconciler), layout_(std::move(layout)), logger_(logger) {}

const std::string& ModeActivationEngine::chain_for(ActiveMode mode) const {
    return mode == ActiveMode::DENY_LIST ? layout_.deny_chain : layout_.allow_chain;
}

uint32_t ModeActivationEngine::member_mark(ActiveMode mode) const {
    return mode == ActiveMode::DENY_LIST ? layout_.limited_mark : layout_.unrestricted_mark;
}

void ModeActivationEngine::plan_teardown(CommandPlan& plan) const {
    for (const std::string* chain : {&layout_.allow_chain, &layout_.deny_chain}) {
        for (const auto& hook : layout_.teardown_hooks) {
            plan.add(Phase::TEARDOWN, ops::DetachChain{layout_.table, hook, *chain});
        }
    }
    plan.add(Phase::TEARDOWN, ops::FlushChain{layout_.table, layout_.allow_chain});
    plan.add(Phase::TEARDOWN, ops::FlushChain{layout_.table, layout_.deny_chain});
}

void ModeActivationEngine::plan_member_rules(CommandPlan& plan, Phase phase, RuleAction action,
                                             const std::string& chain, const DeviceRef& device, uint32_t mark,
                                             uint32_t& position) const {
    auto add_pair = [&](MatchKind match, const std::string& value) {
        uint32_t mark_position = action == RuleAction::INSERT ? position++ : 0;
        plan.add(phase, ops::MarkRule{action, layout_.table, chain, mark_position, match, value, mark});
        uint32_t return_position = action == RuleAction::INSERT ? position++ : 0;
        plan.add(phase, ops::ReturnRule{action, layout_.table, chain, return_position, match, value});
    };
    // MAC rules catch uploads, destination-IP rules catch downloads.
    if (!device.mac.empty()) {
        add_pair(MatchKind::MAC_SOURCE, normalize_mac(device.mac));
    }
    if (!device.ip.empty()) {
        add_pair(MatchKind::IP_DESTINATION, device.ip);
    }
}

void ModeActivationEngine::plan_rates(CommandPlan& plan, const std::vector<std::string>& interfaces,
                                      const std::string& unrestricted_rate, const std::string& limited_rate) const {
    for (const auto& iface : interfaces) {
        plan.add(Phase::APPLY_RATES, ops::ShapingClass{ops::ClassAction::CHANGE, iface, layout_.unrestricted_class,
                                                       unrestricted_rate});
        plan.add(Phase::APPLY_RATES, ops::ShapingClass{ops::ClassAction::CHANGE, iface, layout_.limited_class,
                                                       limited_rate});
    }
}

RouterCommandBundle ModeActivationEngine::activate(ActiveMode mode, int group_id) {
    const std::string& chain = chain_for(mode);
    logger_.info("ModeActivationEngine", "Activating " + active_mode_to_string(mode) + " for group " +
                 std::to_string(group_id));

    RemoteStateDocument document = store_.load();
    const PolicyGroup* group = document.find_group(group_id);
    if (!group) {
        throw InvalidFormatError("Group " + std::to_string(group_id) + " does not exist");
    }

    // Rates and default marks mean nothing without the shaping classes.
    RouterCommandBundle bundle = reconciler_.ensure(false).bundle;
    const std::size_t mark = executor_.history_mark();

    CommandPlan plan;
    plan_teardown(plan);

    const uint32_t default_mark = mode == ActiveMode::ALLOW_LIST ? layout_.limited_mark : layout_.unrestricted_mark;
    plan.add(Phase::REBUILD, ops::CreateChain{layout_.table, chain});
    plan.add(Phase::REBUILD, ops::FlushChain{layout_.table, chain});
    plan.add(Phase::REBUILD, ops::MarkRule{RuleAction::APPEND, layout_.table, chain, 0, MatchKind::ANY, "",
                                           default_mark});
    uint32_t position = 1;
    for (const auto& device : group->devices) {
        plan_member_rules(plan, Phase::REBUILD, RuleAction::INSERT, chain, device, member_mark(mode), position);
    }

    plan.add(Phase::ACTIVATE, ops::AttachChain{layout_.table, layout_.activation_hook, chain});
    // Group marks must be set after the mode's. A missing groups chain is
    // reported idempotently and leaves the hook alone.
    plan.add(Phase::ACTIVATE, ops::DetachChain{layout_.table, layout_.activation_hook, layout_.groups_chain});
    plan.add(Phase::ACTIVATE, ops::AttachChain{layout_.table, layout_.activation_hook, layout_.groups_chain});
    logger_.info("ModeActivationEngine", "Traffic on " + layout_.activation_hook +
                 " is unclassified until " + chain + " is attached");
    executor_.execute(plan);

    try {
        CommandOutput listing = executor_.run(Phase::APPLY_RATES, ops::ListInterfaces{});
        CommandPlan rates;
        plan_rates(rates, parse_interface_list(listing.output), layout_.unrestricted_rate, layout_.limited_rate);
        executor_.execute(rates);
    } catch (const PilotError& e) {
        // The mode stays active with whatever rates were in effect.
        logger_.warning("ModeActivationEngine", std::string("Rate update failed after activation: ") + e.what());
        bundle.warnings.push_back(std::string("rates not applied: ") + e.what());
    }

    bundle.add_all(executor_.history_since(mark));
    logger_.info("ModeActivationEngine", active_mode_to_string(mode) + " active with " +
                 std::to_string(group->devices.size()) + " member devices");
    return bundle;
}

RouterCommandBundle ModeActivationEngine::activate_allow_list(int group_id) {
    return activate(ActiveMode::ALLOW_LIST, group_id);
}

RouterCommandBundle ModeActivationEngine::activate_deny_list(int group_id) {
    return activate(ActiveMode::DENY_LIST, group_id);
}

RouterCommandBundle ModeActivationEngine::deactivate() {
    const std::size_t mark = executor_.history_mark();
    CommandPlan plan;
    plan_teardown(plan);
    executor_.execute(plan);

    RouterCommandBundle bundle;
    bundle.add_all(executor_.history_since(mark));
    logger_.info("ModeActivationEngine", "Mode chains detached and flushed");
    return bundle;
}

std::vector<std::string> ModeActivationEngine::attached_mode_chains(const std::string& hook) {
    CommandOutput listing = executor_.run(Phase::ENSURE_STATE, ops::ListChain{layout_.table, hook});
    std::vector<std::string> attached;
    std::istringstream lines(listing.output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string target;
        fields >> target;
        if (target == layout_.allow_chain || target == layout_.deny_chain) {
            attached.push_back(target);
        }
    }
    return attached;
}

ActiveMode ModeActivationEngine::get_active_mode() {
    std::vector<std::string> attached = attached_mode_chains(layout_.activation_hook);
    bool allow = std::find(attached.begin(), attached.end(), layout_.allow_chain) != attached.end();
    bool deny = std::find(attached.begin(), attached.end(), layout_.deny_chain) != attached.end();
    if (allow && deny) {
        logger_.warning("ModeActivationEngine", "Both mode chains attached to " + layout_.activation_hook +
                        "; reporting the first");
        return attached.front() == layout_.allow_chain ? ActiveMode::ALLOW_LIST : ActiveMode::DENY_LIST;
    }
    if (allow) return ActiveMode::ALLOW_LIST;
    if (deny) return ActiveMode::DENY_LIST;
    return ActiveMode::NONE;
}

ModeValidation ModeActivationEngine::validate_mode() {
    ModeValidation validation;
    for (const auto& hook : layout_.teardown_hooks) {
        std::vector<std::string> attached;
        try {
            attached = attached_mode_chains(hook);
        } catch (const PilotError& e) {
            validation.problems.push_back("cannot list " + hook + ": " + e.what());
            continue;
        }

        if (hook == layout_.activation_hook) {
            if (attached.size() > 1) {
                validation.problems.push_back(std::to_string(attached.size()) + " mode chain references on " + hook);
            }
            if (!attached.empty()) {
                validation.mode = attached.front() == layout_.allow_chain ? ActiveMode::ALLOW_LIST
                                                                          : ActiveMode::DENY_LIST;
            }
        } else {
            for (const auto& chain : attached) {
                validation.problems.push_back(chain + " attached to unexpected hook " + hook);
            }
        }
        validation.attachments[hook] = std::move(attached);
    }
    validation.consistent = validation.problems.empty();
    return validation;
}

RouterCommandBundle ModeActivationEngine::add_device_to_active_list(const DeviceRef& device) {
    if (!is_valid_ip(device.ip) || !is_valid_mac(device.mac)) {
        throw InvalidFormatError("Invalid device " + device.to_string());
    }

    RouterCommandBundle bundle;
    ActiveMode mode = get_active_mode();
    if (mode == ActiveMode::NONE) {
        bundle.warnings.push_back("no mode active; " + device.to_string() + " not added");
        return bundle;
    }

    const std::size_t mark = executor_.history_mark();
    const std::string& chain = chain_for(mode);
    CommandPlan plan;
    uint32_t unused = 0;
    // Drop any earlier copy so repeated adds leave one rule set.
    plan_member_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, chain, device, member_mark(mode), unused);
    uint32_t position = 1;
    plan_member_rules(plan, Phase::REBUILD, RuleAction::INSERT, chain, device, member_mark(mode), position);
    executor_.execute(plan);

    bundle.add_all(executor_.history_since(mark));
    logger_.info("ModeActivationEngine", "Added " + device.to_string() + " to " + chain);
    return bundle;
}

RouterCommandBundle ModeActivationEngine::remove_device_from_active_list(const DeviceRef& device) {
    RouterCommandBundle bundle;
    ActiveMode mode = get_active_mode();
    if (mode == ActiveMode::NONE) {
        bundle.warnings.push_back("no mode active; nothing to remove");
        return bundle;
    }

    const std::size_t mark = executor_.history_mark();
    const std::string& chain = chain_for(mode);
    CommandPlan plan;
    uint32_t unused = 0;
    plan_member_rules(plan, Phase::TEARDOWN, RuleAction::DELETE, chain, device, member_mark(mode), unused);
    executor_.execute(plan);

    bundle.add_all(executor_.history_since(mark));
    logger_.info("ModeActivationEngine", "Removed " + device.to_string() + " from " + chain);
    return bundle;
}

RouterCommandBundle ModeActivationEngine::update_rates(const std::string& unrestricted_rate,
                                                       const std::string& limited_rate) {
    if (!is_valid_rate(unrestricted_rate) || !is_valid_rate(limited_rate)) {
        throw InvalidFormatError("Invalid rate '" + unrestricted_rate + "' / '" + limited_rate + "'");
    }

    const std::size_t mark = executor_.history_mark();
    CommandOutput listing = executor_.run(Phase::APPLY_RATES, ops::ListInterfaces{});
    CommandPlan plan;
    plan_rates(plan, parse_interface_list(listing.output), unrestricted_rate, limited_rate);
    executor_.execute(plan);

    layout_.unrestricted_rate = unrestricted_rate;
    layout_.limited_rate = limited_rate;

    RouterCommandBundle bundle;
    bundle.add_all(executor_.history_since(mark));
    logger_.info("ModeActivationEngine", "Rates set to " + unrestricted_rate + " / " + limited_rate);
    return bundle;
}

} // namespace netpilot
