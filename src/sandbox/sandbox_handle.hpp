/**
 * @file sandbox_handle.hpp
 * @brief RAII owner of one live sandbox.
 */

#pragma once

#include "sandbox/cgroup.hpp"
#include "sandbox/scratch_dir.hpp"
#include "core/unique_fd.hpp"

#include <sys/resource.h>
#include <sys/types.h>

#include <optional>

namespace runbox {

/**
 * @brief Owns the child process (and its process group), the supervisor's
 *        pipe ends, the scratch directory and the cgroup of one execution.
 *
 * Destruction kills the process group, reaps the child, removes the cgroup
 * and the scratch directory, exactly once and on every exit path.
 */
class SandboxHandle {
public:
    SandboxHandle(ScratchDir scratch, std::optional<CgroupController> cgroup);
    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;
    SandboxHandle(SandboxHandle&& other) noexcept;
    SandboxHandle& operator=(SandboxHandle&&) = delete;

    /// Take ownership of a forked child; it is also its process group id.
    void adopt(pid_t pid) noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const ScratchDir& scratch() const noexcept { return scratch_; }
    [[nodiscard]] CgroupController* cgroup() noexcept { return cgroup_ ? &*cgroup_ : nullptr; }

    /// SIGKILL the whole process group and the cgroup. Safe to repeat.
    void kill() noexcept;

    /// Collect the main process without blocking. True once reaped.
    bool try_reap() noexcept;

    /// Block until the main process is collected.
    void reap() noexcept;

    [[nodiscard]] bool reaped() const noexcept { return reaped_; }
    [[nodiscard]] int wait_status() const noexcept { return wait_status_; }
    [[nodiscard]] const struct rusage& usage() const noexcept { return usage_; }

    UniqueFd stdin_fd;      ///< Write end feeding the program's stdin
    UniqueFd stdout_fd;
    UniqueFd stderr_fd;
    UniqueFd status_fd;     ///< Child setup report; EOF once execve succeeded

private:
    ScratchDir scratch_;
    std::optional<CgroupController> cgroup_;
    pid_t pid_{-1};
    bool reaped_{false};
    int wait_status_{0};
    struct rusage usage_ {};
};

}  // namespace runbox
