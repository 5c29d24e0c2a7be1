#include "netpilot/command_runner.hpp"
#include "netpilot/errors.hpp"

namespace netpilot {

PlanExecutor::PlanExecutor(CommandRunner& runner, const CommandClassifier& classifier, PilotLogger& logger)
    : runner_(runner), classifier_(classifier), logger_(logger) {}

CommandOutput PlanExecutor::run(Phase phase, const RemoteCommand& command) {
    const std::string text = render(command);
    logger_.debug("PlanExecutor", "[" + phase_to_string(phase) + "] " + text);

    CommandOutput result = runner_.run(text, stdin_payload(command));
    CommandOutcome outcome = classifier_.classify(result.error_output);
    if (outcome == CommandOutcome::SUCCESS && result.exit_status != 0) {
        // Failed without saying why; nothing shows the target state holds.
        outcome = CommandOutcome::FATAL;
        result.error_output = "exited with status " + std::to_string(result.exit_status) + " and no error output";
    }

    if (outcome == CommandOutcome::FATAL) {
        logger_.error("PlanExecutor", "Phase '" + phase_to_string(phase) + "' command failed: " + text +
                      " stderr: " + PilotLogger::excerpt(result.error_output));
        history_.push_back({phase, command, outcome});
        throw CommandFailureError(phase_to_string(phase), text, PilotLogger::excerpt(result.error_output));
    }
    if (outcome == CommandOutcome::IDEMPOTENT_SUCCESS) {
        logger_.debug("PlanExecutor", "Already in target state: " + text + " (" +
                      PilotLogger::excerpt(result.error_output, 80) + ")");
    }

    history_.push_back({phase, command, outcome});
    return result;
}

void PlanExecutor::execute(const CommandPlan& plan) {
    for (const auto& planned : plan.commands()) {
        run(planned.phase, planned.command);
    }
}

} // namespace netpilot
