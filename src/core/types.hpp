/**
 * @file types.hpp
 * @brief Fundamental types used throughout runbox.
 *
 * Defines JobId, Language, ResourceBudget, ExecutionJob, ExecutionResult and
 * the terminal-state taxonomy. All types are plain values; jobs are shared
 * immutably once accepted.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runbox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using SubmitterId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Language
// ─────────────────────────────────────────────

/**
 * @brief Closed set of supported runtimes.
 *
 * Each value maps to exactly one launch configuration (see LanguageRegistry).
 * Anything else is rejected at admission.
 */
enum class Language : uint8_t {
    Python,
    JavaScript,
    Shell
};

[[nodiscard]] constexpr std::string_view to_string(Language language) noexcept {
    switch (language) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::Shell:      return "shell";
    }
    return "unknown";
}

/**
 * @brief Parse a language tag. Accepts a few common aliases.
 */
[[nodiscard]] std::optional<Language> parse_language(std::string_view tag) noexcept;

// ─────────────────────────────────────────────
// Resource Budget
// ─────────────────────────────────────────────

/**
 * @brief The enforced ceilings for one execution.
 */
struct ResourceBudget {
    uint64_t cpu_time_ms{0};
    uint64_t wall_time_ms{0};
    uint64_t memory_bytes{0};
    uint64_t max_output_bytes{0};
    uint64_t max_processes{0};

    auto operator<=>(const ResourceBudget&) const = default;
};

/**
 * @brief Caller-supplied override; unset fields fall back to defaults.
 */
struct PartialBudget {
    std::optional<uint64_t> cpu_time_ms;
    std::optional<uint64_t> wall_time_ms;
    std::optional<uint64_t> memory_bytes;
    std::optional<uint64_t> max_output_bytes;
    std::optional<uint64_t> max_processes;

    [[nodiscard]] bool empty() const noexcept {
        return !cpu_time_ms && !wall_time_ms && !memory_bytes
            && !max_output_bytes && !max_processes;
    }
};

// ─────────────────────────────────────────────
// Execution Job
// ─────────────────────────────────────────────

/**
 * @brief One accepted submission. Never mutated after admission.
 */
struct ExecutionJob {
    JobId id;
    Language language{Language::Python};
    std::string source;
    std::optional<std::string> stdin_data;
    PartialBudget limits_override;
    ResourceBudget budget;              ///< Resolved at admission
    Timestamp submitted_at;
    SubmitterId submitter;
};

// ─────────────────────────────────────────────
// Terminal State
// ─────────────────────────────────────────────

enum class TerminalState : uint8_t {
    Completed,        ///< Exited with status 0
    TimedOut,         ///< Wall-clock or CPU budget exhausted
    MemoryExceeded,   ///< Memory or process-count budget exhausted
    OutputExceeded,   ///< stdout or stderr reached max_output_bytes
    RuntimeError,     ///< Non-zero exit or fatal signal from the program
    SandboxFailure,   ///< The service itself failed to run the job
    Cancelled         ///< Killed on caller request after dispatch
};

[[nodiscard]] constexpr std::string_view to_string(TerminalState state) noexcept {
    switch (state) {
        case TerminalState::Completed:      return "Completed";
        case TerminalState::TimedOut:       return "TimedOut";
        case TerminalState::MemoryExceeded: return "MemoryExceeded";
        case TerminalState::OutputExceeded: return "OutputExceeded";
        case TerminalState::RuntimeError:   return "RuntimeError";
        case TerminalState::SandboxFailure: return "SandboxFailure";
        case TerminalState::Cancelled:      return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief True for outcomes caused by the submitted program itself.
 */
[[nodiscard]] constexpr bool is_submitter_caused(TerminalState state) noexcept {
    return state != TerminalState::Completed
        && state != TerminalState::SandboxFailure
        && state != TerminalState::Cancelled;
}

// ─────────────────────────────────────────────
// Execution Result
// ─────────────────────────────────────────────

/**
 * @brief The verdict for one job. Produced exactly once.
 */
struct ExecutionResult {
    JobId job_id;
    TerminalState state{TerminalState::SandboxFailure};
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::optional<int> exit_code;
    std::optional<int> signal;
    Millis elapsed{0};
    Millis cpu_time{0};
    uint64_t peak_memory_bytes{0};
};

}  // namespace runbox
