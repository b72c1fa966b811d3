/**
 * @file verdict_builder.cpp
 * @brief VerdictBuilder implementation.
 */

#include "verdict/verdict_builder.hpp"

#include "verdict/utf8.hpp"

#include <csignal>
#include <utility>

namespace runbox {

TerminalState classify(const RawOutcome& outcome, const ResourceBudget& budget) noexcept {
    if (outcome.failed_stage != SetupStage::None) {
        return TerminalState::SandboxFailure;
    }

    switch (outcome.kill_reason) {
        case KillReason::Cancelled:    return TerminalState::Cancelled;
        case KillReason::OutputLimit:  return TerminalState::OutputExceeded;
        case KillReason::MemoryLimit:
        case KillReason::ProcessLimit: return TerminalState::MemoryExceeded;
        case KillReason::WallTime:
        case KillReason::CpuTime:      return TerminalState::TimedOut;
        case KillReason::None:         break;
    }

    // The kernel can end the program before the supervisor notices.
    if (outcome.oom_event || outcome.pids_event) return TerminalState::MemoryExceeded;
    if (budget.memory_bytes > 0 && outcome.peak_memory_bytes > budget.memory_bytes) {
        return TerminalState::MemoryExceeded;
    }
    if (outcome.signaled && outcome.term_signal == SIGXCPU) return TerminalState::TimedOut;

    if (outcome.exited && outcome.exit_code == 0) return TerminalState::Completed;
    return TerminalState::RuntimeError;
}

ExecutionResult VerdictBuilder::build(RawOutcome outcome, const ResourceBudget& budget) const {
    ExecutionResult result;
    result.job_id = outcome.job_id;
    result.state = classify(outcome, budget);
    result.elapsed = outcome.elapsed;
    result.cpu_time = outcome.cpu_time;
    result.peak_memory_bytes = outcome.peak_memory_bytes;

    if (result.state == TerminalState::SandboxFailure) {
        return result;
    }

    result.stdout_text = decode_utf8_lossy(outcome.out.bytes);
    result.stderr_text = decode_utf8_lossy(outcome.err.bytes);
    result.stdout_truncated = outcome.out.truncated;
    result.stderr_truncated = outcome.err.truncated;

    if (outcome.exited) result.exit_code = outcome.exit_code;
    if (outcome.signaled) result.signal = outcome.term_signal;
    return result;
}

}  // namespace runbox
