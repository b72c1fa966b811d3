/**
 * @file raw_outcome.hpp
 * @brief Unclassified record of how one sandbox execution ended.
 *
 * Produced by the SandboxRunner, consumed by the VerdictBuilder.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace runbox {

/// Why the supervisor killed the sandbox, if it did.
enum class KillReason : uint8_t {
    None,
    WallTime,
    CpuTime,
    MemoryLimit,
    ProcessLimit,
    OutputLimit,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(KillReason reason) noexcept {
    switch (reason) {
        case KillReason::None:         return "none";
        case KillReason::WallTime:     return "wall_time";
        case KillReason::CpuTime:      return "cpu_time";
        case KillReason::MemoryLimit:  return "memory";
        case KillReason::ProcessLimit: return "process_limit";
        case KillReason::OutputLimit:  return "output";
        case KillReason::Cancelled:    return "cancelled";
    }
    return "unknown";
}

/// Which step of sandbox construction or supervision failed.
enum class SetupStage : uint8_t {
    None,
    Scratch,
    Cgroup,
    Pipes,
    Fork,
    Namespaces,
    Filesystem,
    Rlimits,
    Redirect,
    Exec,
    Supervise
};

[[nodiscard]] constexpr std::string_view to_string(SetupStage stage) noexcept {
    switch (stage) {
        case SetupStage::None:       return "none";
        case SetupStage::Scratch:    return "scratch";
        case SetupStage::Cgroup:     return "cgroup";
        case SetupStage::Pipes:      return "pipes";
        case SetupStage::Fork:       return "fork";
        case SetupStage::Namespaces: return "namespaces";
        case SetupStage::Filesystem: return "filesystem";
        case SetupStage::Rlimits:    return "rlimits";
        case SetupStage::Redirect:   return "redirect";
        case SetupStage::Exec:       return "exec";
        case SetupStage::Supervise:  return "supervise";
    }
    return "unknown";
}

struct CapturedStream {
    std::string bytes;
    bool truncated{false};
};

struct RawOutcome {
    JobId job_id;

    // Service-side failure; takes precedence over everything else.
    SetupStage failed_stage{SetupStage::None};
    std::string failure_detail;

    KillReason kill_reason{KillReason::None};

    bool exited{false};
    int exit_code{0};
    bool signaled{false};
    int term_signal{0};

    bool oom_event{false};          ///< cgroup memory.events oom_kill
    bool pids_event{false};         ///< cgroup pids.events max

    CapturedStream out;
    CapturedStream err;

    Millis elapsed{0};
    Millis cpu_time{0};
    uint64_t peak_memory_bytes{0};
};

}  // namespace runbox
