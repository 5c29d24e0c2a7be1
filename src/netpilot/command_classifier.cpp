#include "netpilot/command_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace netpilot {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::string outcome_to_string(CommandOutcome outcome) {
    switch (outcome) {
        case CommandOutcome::SUCCESS:            return "success";
        case CommandOutcome::IDEMPOTENT_SUCCESS: return "idempotent_success";
        case CommandOutcome::FATAL:              return "fatal";
        default:                                 return "unknown";
    }
}

CommandClassifier::CommandClassifier() : rules_(default_rules()) {}

CommandClassifier::CommandClassifier(std::vector<ClassificationRule> rules) : rules_(std::move(rules)) {
    for (auto& rule : rules_) {
        rule.pattern = to_lower(rule.pattern);
    }
}

std::vector<ClassificationRule> CommandClassifier::default_rules() {
    return {
        // A malformed command never means the target state holds.
        {"syntax error", CommandOutcome::FATAL},
        {"file exists", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"chain already exists", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"object already exists", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"already exists", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"cannot find", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"no such file", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"no chain/target/match", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"bad rule", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"does not exist", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"exclusivity flag on", CommandOutcome::IDEMPOTENT_SUCCESS},
        {"cannot delete qdisc with handle of zero", CommandOutcome::IDEMPOTENT_SUCCESS},
    };
}

const ClassificationRule* CommandClassifier::matching_rule(const std::string& error_output) const {
    const std::string lower = to_lower(error_output);
    for (const auto& rule : rules_) {
        if (lower.find(rule.pattern) != std::string::npos) {
            return &rule;
        }
    }
    return nullptr;
}

CommandOutcome CommandClassifier::classify(const std::string& error_output) const {
    if (is_blank(error_output)) {
        return CommandOutcome::SUCCESS;
    }
    const ClassificationRule* rule = matching_rule(error_output);
    return rule ? rule->outcome : CommandOutcome::FATAL;
}

void CommandClassifier::add_rule(ClassificationRule rule) {
    rule.pattern = to_lower(rule.pattern);
    rules_.push_back(std::move(rule));
}

} // namespace netpilot
