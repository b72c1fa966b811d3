/**
 * @file process_sampler.hpp
 * @brief Usage sampling of a sandbox's process group from /proc.
 *
 * Used when cgroup enforcement is off. Each sample walks /proc and sums the
 * members of one job: its process group, plus any process that left the group
 * but lives in the pid namespace the group leader created.
 */

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace runbox {

struct GroupUsage {
    uint64_t rss_bytes{0};          ///< Sum of resident set sizes
    uint64_t cpu_time_ms{0};        ///< utime + stime (+ reaped children) summed
    uint32_t process_count{0};
};

/// Fields of /proc/<pid>/stat the sampler needs.
struct ProcStat {
    pid_t pid{0};
    char state{'?'};
    pid_t pgrp{0};
    uint64_t utime_ticks{0};
    uint64_t stime_ticks{0};
    uint64_t cutime_ticks{0};
    uint64_t cstime_ticks{0};
    uint64_t start_ticks{0};        ///< Clock ticks after boot
    uint64_t rss_pages{0};
};

/**
 * @brief Parse one /proc/<pid>/stat line. The comm field may contain spaces
 *        and parentheses, so parsing resumes after the last ')'.
 */
[[nodiscard]] std::optional<ProcStat> parse_proc_stat(std::string_view line);

class ProcessGroupSampler {
public:
    explicit ProcessGroupSampler(pid_t pgid);

    /// Walk /proc once. Zombies count as processes but not as memory.
    [[nodiscard]] GroupUsage sample();

    [[nodiscard]] uint64_t peak_rss_bytes() const noexcept { return peak_rss_; }

private:
    /// Learn the leader's child pid namespace once it has unshared.
    void resolve_namespace();
    [[nodiscard]] bool in_job_namespace(const char* pid) const;

    pid_t pgid_;
    bool ns_known_{false};
    dev_t ns_dev_{0};
    ino_t ns_ino_{0};
    uint64_t leader_start_{0};
    uint64_t peak_rss_{0};
    long page_size_;
    long ticks_per_sec_;
};

}  // namespace runbox
