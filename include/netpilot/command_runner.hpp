#ifndef NETPILOT_COMMAND_RUNNER_HPP
#define NETPILOT_COMMAND_RUNNER_HPP

#include "netpilot/command_classifier.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/remote_command.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace netpilot {

struct CommandOutput {
    std::string output;       // remote stdout
    std::string error_output; // remote stderr
    int exit_status = 0;      // remote shell status
};

// A command channel to one device. A command that ran and wrote to stderr is
// returned normally; transport failures and timeouts throw ConnectionError.
// `input` is fed to the command's stdin.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandOutput run(const std::string& command, const std::string& input) = 0;

    CommandOutput run(const std::string& command) { return run(command, std::string()); }
};

struct ExecutedCommand {
    Phase phase;
    RemoteCommand command;
    CommandOutcome outcome;
};

// Runs typed commands through a CommandRunner and applies the classifier.
class PlanExecutor {
public:
    PlanExecutor(CommandRunner& runner, const CommandClassifier& classifier, PilotLogger& logger);

    // Throws CommandFailureError when stderr is not idempotent-equivalent.
    CommandOutput run(Phase phase, const RemoteCommand& command);

    // Runs the commands in plan order and stops at the first fatal one.
    void execute(const CommandPlan& plan);

    const std::vector<ExecutedCommand>& history() const { return history_; }
    std::vector<ExecutedCommand> history_since(std::size_t mark) const {
        if (mark >= history_.size()) return {};
        return std::vector<ExecutedCommand>(history_.begin() + static_cast<std::ptrdiff_t>(mark), history_.end());
    }
    std::size_t history_mark() const { return history_.size(); }
    void clear_history() { history_.clear(); }

private:
    CommandRunner& runner_;
    const CommandClassifier& classifier_;
    PilotLogger& logger_;
    std::vector<ExecutedCommand> history_;
};

} // namespace netpilot

#endif // NETPILOT_COMMAND_RUNNER_HPP
