#include "gtest/gtest.h"
#include "netpilot/command_classifier.hpp"

#include <string>
#include <vector>

using netpilot::CommandClassifier;
using netpilot::CommandOutcome;

class CommandClassifierTest : public ::testing::Test {
protected:
    CommandClassifier classifier;
};

TEST_F(CommandClassifierTest, BlankErrorOutputIsSuccess) {
    EXPECT_EQ(classifier.classify(""), CommandOutcome::SUCCESS);
    EXPECT_EQ(classifier.classify("  \n\t"), CommandOutcome::SUCCESS);
}

TEST_F(CommandClassifierTest, KnownIdempotentMessages) {
    const char* messages[] = {
        "iptables: Chain already exists.",
        "iptables: No chain/target/match by that name.",
        "iptables: Bad rule (does a matching rule exist in that chain?).",
        "RTNETLINK answers: File exists",
        "RTNETLINK answers: No such file or directory",
        "Error: Cannot delete qdisc with handle of zero.",
        "Error: Exclusivity flag on, cannot modify.",
        "Cannot find device \"eth9\"",
    };
    for (const char* message : messages) {
        EXPECT_EQ(classifier.classify(message), CommandOutcome::IDEMPOTENT_SUCCESS) << message;
    }
}

TEST_F(CommandClassifierTest, MatchingIsCaseInsensitive) {
    EXPECT_EQ(classifier.classify("OBJECT ALREADY EXISTS"), CommandOutcome::IDEMPOTENT_SUCCESS);
}

TEST_F(CommandClassifierTest, UnknownErrorsAreFatal) {
    EXPECT_EQ(classifier.classify("iptables: Index of insertion too big."), CommandOutcome::FATAL);
    EXPECT_EQ(classifier.classify("Permission denied"), CommandOutcome::FATAL);
}

TEST_F(CommandClassifierTest, SyntaxErrorWinsOverLaterPatterns) {
    // Listed first, so "no such file" further down never applies.
    EXPECT_EQ(classifier.classify("Error: syntax error, no such file"), CommandOutcome::FATAL);
    const netpilot::ClassificationRule* rule = classifier.matching_rule("Error: syntax error, no such file");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->pattern, "syntax error");
}

TEST_F(CommandClassifierTest, CustomRulesAreLowercasedAndAppended) {
    CommandClassifier custom{std::vector<netpilot::ClassificationRule>()};
    EXPECT_EQ(custom.classify("RTNETLINK answers: File exists"), CommandOutcome::FATAL);
    custom.add_rule({"File EXISTS", CommandOutcome::IDEMPOTENT_SUCCESS});
    EXPECT_EQ(custom.classify("RTNETLINK answers: File exists"), CommandOutcome::IDEMPOTENT_SUCCESS);
    ASSERT_EQ(custom.rules().size(), 1u);
    EXPECT_EQ(custom.rules()[0].pattern, "file exists");
}

TEST(CommandOutcomeTest, Names) {
    EXPECT_EQ(netpilot::outcome_to_string(CommandOutcome::SUCCESS), "success");
    EXPECT_EQ(netpilot::outcome_to_string(CommandOutcome::IDEMPOTENT_SUCCESS), "idempotent_success");
    EXPECT_EQ(netpilot::outcome_to_string(CommandOutcome::FATAL), "fatal");
}
