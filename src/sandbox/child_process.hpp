/**
 * @file child_process.hpp
 * @brief Child-side sandbox construction between fork() and execve().
 *
 * The service is multi-threaded, so the forked child may only make
 * async-signal-safe calls. Every string, path and limit the child needs is
 * therefore prepared in a ChildPlan before the fork, and the child only
 * walks it.
 */

#pragma once

#include "sandbox/raw_outcome.hpp"

#include <sys/resource.h>
#include <sys/types.h>

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace runbox {

/// Processes a job runs besides its program: the leader and the namespace init.
inline constexpr uint32_t kHelperProcesses = 2;

/// Written to the status pipe by a child that could not reach execve().
struct ChildReport {
    SetupStage stage{SetupStage::None};
    int32_t error{0};
};

struct MountSpec {
    enum class Kind : uint8_t { Directory, File, Symlink };

    const char* source{nullptr};
    const char* target{nullptr};        ///< Absolute, under the new root
    const char* link_target{nullptr};   ///< Symlink only
    Kind kind{Kind::Directory};
    bool writable{false};
    unsigned long locked_flags{0};      ///< Flags that must survive a remount
};

struct RlimitSpec {
    int resource{0};
    rlimit value{};
};

/**
 * @brief Everything the child does, precomputed.
 *
 * Owns the backing strings; pointers handed to the child stay valid as long
 * as the plan lives (strings are kept in a deque, which never relocates).
 */
class ChildPlan {
public:
    const char* intern(std::string value);

    void set_argv(const std::vector<std::string>& argv);
    void add_env(const std::string& key, const std::string& value);

    /// Resolve `host_path` now and schedule a bind mount of it under the new root.
    void add_bind(const std::string& host_path, const std::string& target_path, bool writable);

    void add_rlimit(int resource, rlim_t soft, rlim_t hard);

    /// Null-terminate argv/envp. Call once before fork().
    void finalize();

    const char* work_dir{nullptr};          ///< chdir target as seen by the program
    const char* rootfs{nullptr};            ///< New root mount point
    const char* old_root{nullptr};          ///< pivot_root put_old
    const char* uid_map{nullptr};
    const char* gid_map{nullptr};
    std::vector<MountSpec> mounts;
    std::vector<RlimitSpec> rlimits;

    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int status_fd{-1};
    int go_fd{-1};                          ///< Blocks the child until released; -1 = no wait

    pid_t supervisor_pid{0};

    std::vector<char*> argv;
    std::vector<char*> envp;

private:
    std::deque<std::string> storage_;
};

/**
 * @brief Child entry point after fork(). Never returns.
 *
 * Process tree of one job, all in the supervisor's process group:
 *
 *   leader      unshares, builds the root, mirrors the program's wait status
 *   └─ init     PID 1 of the job's pid namespace; reaps every orphan
 *      └─ program
 *
 * The namespace dies with init, so processes that leave the group are killed
 * too. On any setup failure a ChildReport goes to `plan.status_fd` and the
 * process exits 127.
 */
[[noreturn]] void run_child(const ChildPlan& plan) noexcept;

}  // namespace runbox
