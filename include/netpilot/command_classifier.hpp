#ifndef NETPILOT_COMMAND_CLASSIFIER_HPP
#define NETPILOT_COMMAND_CLASSIFIER_HPP

#include <string>
#include <vector>

namespace netpilot {

enum class CommandOutcome {
    SUCCESS,
    IDEMPOTENT_SUCCESS, // error text says the target state already holds
    FATAL
};

std::string outcome_to_string(CommandOutcome outcome);

struct ClassificationRule {
    std::string pattern; // matched case-insensitively as a substring of stderr
    CommandOutcome outcome;
};

// Ordered pattern table for remote stderr. First matching rule wins; text
// that matches no rule is fatal.
class CommandClassifier {
public:
    CommandClassifier();
    explicit CommandClassifier(std::vector<ClassificationRule> rules);

    CommandOutcome classify(const std::string& error_output) const;

    // Rule whose pattern matched, or nullptr.
    const ClassificationRule* matching_rule(const std::string& error_output) const;

    void add_rule(ClassificationRule rule);
    const std::vector<ClassificationRule>& rules() const { return rules_; }

    static std::vector<ClassificationRule> default_rules();

private:
    std::vector<ClassificationRule> rules_;
};

} // namespace netpilot

#endif // NETPILOT_COMMAND_CLASSIFIER_HPP
