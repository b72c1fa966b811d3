/**
 * @file verdict_builder.hpp
 * @brief Maps a RawOutcome onto exactly one TerminalState.
 *
 * Precedence, first match wins:
 *
 *   setup / supervision failure      -> SandboxFailure
 *   killed on caller request         -> Cancelled
 *   output cap hit                   -> OutputExceeded
 *   memory / process budget hit      -> MemoryExceeded
 *   wall or CPU budget hit, SIGXCPU  -> TimedOut
 *   exit status 0                    -> Completed
 *   anything else                    -> RuntimeError
 */

#pragma once

#include "core/types.hpp"
#include "sandbox/raw_outcome.hpp"

namespace runbox {

[[nodiscard]] TerminalState classify(const RawOutcome& outcome, const ResourceBudget& budget) noexcept;

class VerdictBuilder {
public:
    /// Build the caller-visible result. Output of a SandboxFailure is withheld.
    [[nodiscard]] ExecutionResult build(RawOutcome outcome, const ResourceBudget& budget) const;
};

}  // namespace runbox
