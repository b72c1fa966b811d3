/**
 * @file process_sampler.cpp
 * @brief ProcessGroupSampler: /proc/<pid>/stat parsing and job aggregation.
 */

#include "sandbox/process_sampler.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace runbox {

namespace {

/// Read a small procfs file into buf. Returns bytes read or -1.
ssize_t read_small_file(const char* path, char* buf, size_t cap) {
    int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return -1;
    ssize_t n = ::read(fd, buf, cap - 1);
    ::close(fd);
    if (n >= 0) buf[n] = '\0';
    return n;
}

bool parse_u64(std::string_view token, uint64_t& out) {
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{};
}

bool parse_i64(std::string_view token, int64_t& out) {
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{};
}

}  // anonymous namespace

std::optional<ProcStat> parse_proc_stat(std::string_view line) {
    ProcStat st;

    auto open = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::nullopt;
    }

    int64_t pid = 0;
    if (!parse_i64(line.substr(0, open), pid)) return std::nullopt;
    st.pid = static_cast<pid_t>(pid);

    // Fields after comm, 1-based from field 3 (state).
    std::string_view rest = line.substr(close + 1);
    int field = 2;
    size_t pos = 0;
    while (pos < rest.size()) {
        while (pos < rest.size() && rest[pos] == ' ') ++pos;
        if (pos >= rest.size()) break;
        auto end = rest.find(' ', pos);
        if (end == std::string_view::npos) end = rest.size();
        std::string_view token = rest.substr(pos, end - pos);
        ++field;

        int64_t signed_value = 0;
        switch (field) {
            case 3:
                st.state = token.empty() ? '?' : token[0];
                break;
            case 5:
                if (!parse_i64(token, signed_value)) return std::nullopt;
                st.pgrp = static_cast<pid_t>(signed_value);
                break;
            case 14: if (!parse_u64(token, st.utime_ticks)) return std::nullopt; break;
            case 15: if (!parse_u64(token, st.stime_ticks)) return std::nullopt; break;
            case 16:
                if (!parse_i64(token, signed_value)) return std::nullopt;
                st.cutime_ticks = static_cast<uint64_t>(std::max<int64_t>(signed_value, 0));
                break;
            case 17:
                if (!parse_i64(token, signed_value)) return std::nullopt;
                st.cstime_ticks = static_cast<uint64_t>(std::max<int64_t>(signed_value, 0));
                break;
            case 22: if (!parse_u64(token, st.start_ticks)) return std::nullopt; break;
            case 24:
                if (!parse_i64(token, signed_value)) return std::nullopt;
                st.rss_pages = static_cast<uint64_t>(std::max<int64_t>(signed_value, 0));
                return st;
            default:
                break;
        }
        pos = end;
    }
    return std::nullopt;
}

ProcessGroupSampler::ProcessGroupSampler(pid_t pgid)
    : pgid_(pgid)
    , page_size_(::sysconf(_SC_PAGESIZE))
    , ticks_per_sec_(::sysconf(_SC_CLK_TCK)) {
    if (page_size_ <= 0) page_size_ = 4096;
    if (ticks_per_sec_ <= 0) ticks_per_sec_ = 100;
}

void ProcessGroupSampler::resolve_namespace() {
    char path[64];
    std::snprintf(path, sizeof(path), "/proc/%d/ns/pid_for_children", static_cast<int>(pgid_));

    struct stat own {};
    struct stat job {};
    if (::stat("/proc/self/ns/pid", &own) != 0 || ::stat(path, &job) != 0) return;
    if (own.st_dev == job.st_dev && own.st_ino == job.st_ino) return;   // not unshared yet

    char buf[1024];
    std::snprintf(path, sizeof(path), "/proc/%d/stat", static_cast<int>(pgid_));
    if (read_small_file(path, buf, sizeof(buf)) <= 0) return;
    auto leader = parse_proc_stat(buf);
    if (!leader) return;

    ns_dev_ = job.st_dev;
    ns_ino_ = job.st_ino;
    leader_start_ = leader->start_ticks;
    ns_known_ = true;
}

bool ProcessGroupSampler::in_job_namespace(const char* pid) const {
    char path[64];
    std::snprintf(path, sizeof(path), "/proc/%s/ns/pid", pid);
    struct stat ns {};
    return ::stat(path, &ns) == 0 && ns.st_dev == ns_dev_ && ns.st_ino == ns_ino_;
}

GroupUsage ProcessGroupSampler::sample() {
    GroupUsage usage;
    if (!ns_known_) resolve_namespace();

    DIR* proc = ::opendir("/proc");
    if (!proc) return usage;

    char path[64];
    char buf[1024];
    uint64_t ticks = 0;

    while (auto* entry = ::readdir(proc)) {
        const char* name = entry->d_name;
        if (name[0] < '0' || name[0] > '9') continue;

        std::snprintf(path, sizeof(path), "/proc/%s/stat", name);

        if (read_small_file(path, buf, sizeof(buf)) <= 0) continue;
        auto st = parse_proc_stat(buf);
        if (!st) continue;

        // Only processes started after the leader can have joined its namespace.
        bool member = st->pgrp == pgid_
            || (ns_known_ && st->start_ticks >= leader_start_ && in_job_namespace(name));
        if (!member) continue;

        ++usage.process_count;
        if (st->state != 'Z') {
            usage.rss_bytes += st->rss_pages * static_cast<uint64_t>(page_size_);
        }
        ticks += st->utime_ticks + st->stime_ticks + st->cutime_ticks + st->cstime_ticks;
    }
    ::closedir(proc);

    usage.cpu_time_ms = ticks * 1000 / static_cast<uint64_t>(ticks_per_sec_);
    peak_rss_ = std::max(peak_rss_, usage.rss_bytes);
    return usage;
}

}  // namespace runbox
