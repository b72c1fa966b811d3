/**
 * @file sandbox_handle.cpp
 * @brief SandboxHandle implementation.
 */

#include "sandbox/sandbox_handle.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <utility>

namespace runbox {

SandboxHandle::SandboxHandle(ScratchDir scratch, std::optional<CgroupController> cgroup)
    : scratch_(std::move(scratch)), cgroup_(std::move(cgroup)) {}

SandboxHandle::SandboxHandle(SandboxHandle&& other) noexcept
    : stdin_fd(std::move(other.stdin_fd))
    , stdout_fd(std::move(other.stdout_fd))
    , stderr_fd(std::move(other.stderr_fd))
    , status_fd(std::move(other.status_fd))
    , scratch_(std::move(other.scratch_))
    , cgroup_(std::move(other.cgroup_))
    , pid_(std::exchange(other.pid_, -1))
    , reaped_(std::exchange(other.reaped_, false))
    , wait_status_(other.wait_status_)
    , usage_(other.usage_) {
    other.cgroup_.reset();
}

SandboxHandle::~SandboxHandle() {
    // Close our pipe ends first so nothing in the group blocks writing to us.
    stdin_fd.reset();
    stdout_fd.reset();
    stderr_fd.reset();
    status_fd.reset();

    kill();
    reap();
    if (cgroup_) cgroup_->destroy();
    scratch_.remove();
}

void SandboxHandle::adopt(pid_t pid) noexcept {
    pid_ = pid;
    reaped_ = false;
}

void SandboxHandle::kill() noexcept {
    if (cgroup_) cgroup_->kill_all();
    if (pid_ <= 0) return;
    // Stragglers may outlive the leader; the group id stays reserved while
    // any member exists, so this never hits an unrelated process.
    ::kill(-pid_, SIGKILL);
    if (!reaped_) ::kill(pid_, SIGKILL);
}

bool SandboxHandle::try_reap() noexcept {
    if (pid_ <= 0 || reaped_) return true;
    int status = 0;
    pid_t r = ::wait4(pid_, &status, WNOHANG, &usage_);
    if (r == pid_) {
        wait_status_ = status;
        reaped_ = true;
    } else if (r < 0 && errno == ECHILD) {
        reaped_ = true;
    }
    return reaped_;
}

void SandboxHandle::reap() noexcept {
    if (pid_ <= 0 || reaped_) return;
    int status = 0;
    pid_t r;
    do {
        r = ::wait4(pid_, &status, 0, &usage_);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) wait_status_ = status;
    reaped_ = true;
}

}  // namespace runbox
