/**
 * @file sandbox_runner.hpp
 * @brief Runs one job in a fresh sandbox and supervises it to completion.
 *
 * Each call builds its own SandboxHandle; nothing is shared between calls, so
 * one runner may be used by every worker thread concurrently.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "language/language.hpp"
#include "sandbox/raw_outcome.hpp"
#include "telemetry/metrics_collector.hpp"
#include "verdict/verdict_builder.hpp"

#include <atomic>
#include <cstdint>
#include <stop_token>

namespace runbox {

class SandboxRunner {
public:
    explicit SandboxRunner(const Config& config, Logger* logger = nullptr,
                           MetricsCollector* metrics = nullptr);

    /**
     * @brief Execute and supervise, without classifying.
     *
     * Blocks until the program and every process it started are gone. A stop
     * request kills the sandbox and reports KillReason::Cancelled.
     */
    [[nodiscard]] RawOutcome execute_raw(const ExecutionJob& job,
                                         const ResourceBudget& budget,
                                         std::stop_token stop);

    /// execute_raw() followed by the VerdictBuilder.
    [[nodiscard]] ExecutionResult run(const ExecutionJob& job,
                                      const ResourceBudget& budget,
                                      std::stop_token stop);

    [[nodiscard]] const LanguageRegistry& languages() const noexcept { return languages_; }

private:
    SandboxConfig sandbox_;
    LanguageRegistry languages_;
    VerdictBuilder verdicts_;
    Logger* logger_;
    MetricsCollector* metrics_;
    std::atomic<uint64_t> sequence_{0};
};

static_assert(SandboxRunnerLike<SandboxRunner>);

}  // namespace runbox
