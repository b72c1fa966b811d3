/**
 * @file cgroup.hpp
 * @brief cgroup v2 controller for one sandbox.
 *
 * Layout under the configured root (which must be delegated to the service):
 *
 *   <cgroup_root>/
 *   └── <job>-<n>/      memory.max, memory.swap.max, pids.max
 *
 * Kernel-enforced limits close the sampling gap for memory and process count.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace runbox {

struct CgroupUsage {
    uint64_t memory_current{0};
    uint64_t memory_peak{0};
    uint64_t pids_current{0};
    uint64_t cpu_usage_usec{0};
    bool oom_killed{false};
    bool pids_limit_hit{false};
};

class CgroupController {
public:
    /// Create `<root>/<name>` and enable the controllers it needs.
    static Result<CgroupController> create(const std::filesystem::path& root,
                                           const std::string& name);

    ~CgroupController();

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;
    CgroupController(CgroupController&& other) noexcept;
    CgroupController& operator=(CgroupController&& other) noexcept;

    Result<void> apply(const ResourceBudget& budget);
    Result<void> attach(pid_t pid);
    [[nodiscard]] CgroupUsage usage() const;

    /// Kill every process in the group (cgroup.kill).
    void kill_all() noexcept;

    /// Kill, wait briefly for the group to empty, then rmdir. Idempotent.
    void destroy() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit CgroupController(std::filesystem::path path);

    Result<void> write_file(const char* name, const std::string& content) const;
    [[nodiscard]] std::string read_file(const char* name) const;
    [[nodiscard]] uint64_t read_u64(const char* name) const;

    std::filesystem::path path_;
};

/// Parse `key value` lines (memory.events, cpu.stat, pids.events).
[[nodiscard]] uint64_t parse_flat_keyed(const std::string& content, const std::string& key);

}  // namespace runbox
