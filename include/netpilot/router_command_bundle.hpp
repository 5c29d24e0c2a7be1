#ifndef NETPILOT_ROUTER_COMMAND_BUNDLE_HPP
#define NETPILOT_ROUTER_COMMAND_BUNDLE_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/remote_command.hpp"

#include <string>
#include <vector>

namespace netpilot {

// Commands a call executed (or would execute, for a dry run), grouped for
// audit. State reads/writes and inspections are not listed.
struct RouterCommandBundle {
    std::vector<std::string> tc_commands;
    std::vector<std::string> iptables_commands;
    std::vector<std::string> cleanup_commands;
    std::vector<std::string> warnings;
    bool requires_restart = false;
    bool dry_run = false;

    void add(const RemoteCommand& command) {
        switch (category_of(command)) {
            case CommandCategory::TRAFFIC_SHAPING:
                tc_commands.push_back(render(command));
                break;
            case CommandCategory::RULE_CHAIN:
                iptables_commands.push_back(render(command));
                break;
            case CommandCategory::CLEANUP:
                cleanup_commands.push_back(render(command));
                break;
            default:
                break;
        }
    }

    void add_all(const std::vector<ExecutedCommand>& history) {
        for (const auto& executed : history) {
            if (executed.outcome == CommandOutcome::FATAL) continue;
            add(executed.command);
        }
    }

    void add_all(const CommandPlan& plan) {
        for (const auto& planned : plan.commands()) {
            add(planned.command);
        }
    }

    void merge(const RouterCommandBundle& other) {
        tc_commands.insert(tc_commands.end(), other.tc_commands.begin(), other.tc_commands.end());
        iptables_commands.insert(iptables_commands.end(), other.iptables_commands.begin(), other.iptables_commands.end());
        cleanup_commands.insert(cleanup_commands.end(), other.cleanup_commands.begin(), other.cleanup_commands.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        requires_restart = requires_restart || other.requires_restart;
    }

    std::size_t command_count() const {
        return tc_commands.size() + iptables_commands.size() + cleanup_commands.size();
    }
};

} // namespace netpilot

#endif // NETPILOT_ROUTER_COMMAND_BUNDLE_HPP
