/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for runbox interfaces.
 *
 * The execution service is parameterised on its runner so tests can swap the
 * real sandbox for a scripted one without virtual dispatch.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <stop_token>

namespace runbox {

// ─────────────────────────────────────────────
// SandboxRunnerLike
// ─────────────────────────────────────────────

/**
 * @concept SandboxRunnerLike
 * @brief Constrains types that can execute one job to a verdict.
 *
 * `run` blocks the calling worker until the job terminates. A stop request on
 * the token must end the execution through the kill path and still produce a
 * result.
 */
template <typename T>
concept SandboxRunnerLike = requires(T runner, const ExecutionJob& job, std::stop_token stop) {
    { runner.run(job, job.budget, stop) } -> std::same_as<ExecutionResult>;
};

}  // namespace runbox
