/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace runbox;

TEST(LanguageTest, ParseCanonicalTags) {
    EXPECT_EQ(parse_language("python"), Language::Python);
    EXPECT_EQ(parse_language("javascript"), Language::JavaScript);
    EXPECT_EQ(parse_language("shell"), Language::Shell);
}

TEST(LanguageTest, ParseAliases) {
    EXPECT_EQ(parse_language("py"), Language::Python);
    EXPECT_EQ(parse_language("python3"), Language::Python);
    EXPECT_EQ(parse_language("node"), Language::JavaScript);
    EXPECT_EQ(parse_language("sh"), Language::Shell);
}

TEST(LanguageTest, UnknownTagRejected) {
    EXPECT_FALSE(parse_language("cobol").has_value());
    EXPECT_FALSE(parse_language("").has_value());
    EXPECT_FALSE(parse_language("Python").has_value());
}

TEST(LanguageTest, RoundTripsThroughToString) {
    for (auto lang : {Language::Python, Language::JavaScript, Language::Shell}) {
        EXPECT_EQ(parse_language(to_string(lang)), lang);
    }
}

TEST(TerminalStateTest, ToString) {
    EXPECT_EQ(to_string(TerminalState::Completed), "Completed");
    EXPECT_EQ(to_string(TerminalState::TimedOut), "TimedOut");
    EXPECT_EQ(to_string(TerminalState::MemoryExceeded), "MemoryExceeded");
    EXPECT_EQ(to_string(TerminalState::OutputExceeded), "OutputExceeded");
    EXPECT_EQ(to_string(TerminalState::RuntimeError), "RuntimeError");
    EXPECT_EQ(to_string(TerminalState::SandboxFailure), "SandboxFailure");
    EXPECT_EQ(to_string(TerminalState::Cancelled), "Cancelled");
}

TEST(TerminalStateTest, SubmitterCaused) {
    EXPECT_TRUE(is_submitter_caused(TerminalState::TimedOut));
    EXPECT_TRUE(is_submitter_caused(TerminalState::MemoryExceeded));
    EXPECT_TRUE(is_submitter_caused(TerminalState::OutputExceeded));
    EXPECT_TRUE(is_submitter_caused(TerminalState::RuntimeError));
    EXPECT_FALSE(is_submitter_caused(TerminalState::Completed));
    EXPECT_FALSE(is_submitter_caused(TerminalState::SandboxFailure));
    EXPECT_FALSE(is_submitter_caused(TerminalState::Cancelled));
}

TEST(ResourceBudgetTest, ThreeWayComparison) {
    ResourceBudget a{.cpu_time_ms = 100, .wall_time_ms = 200};
    ResourceBudget b{.cpu_time_ms = 200, .wall_time_ms = 200};

    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(a == a);
}

TEST(PartialBudgetTest, Empty) {
    PartialBudget none;
    EXPECT_TRUE(none.empty());

    PartialBudget some;
    some.max_processes = 4;
    EXPECT_FALSE(some.empty());
}

TEST(ExecutionResultTest, DefaultsToSandboxFailure) {
    ExecutionResult result;
    EXPECT_EQ(result.state, TerminalState::SandboxFailure);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.signal.has_value());
    EXPECT_EQ(result.elapsed.count(), 0);
}
