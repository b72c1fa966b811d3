/**
 * @file sandbox_runner.cpp
 * @brief SandboxRunner: sandbox construction, supervision loop, teardown.
 */

#include "sandbox/sandbox_runner.hpp"

#include "sandbox/child_process.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/process_sampler.hpp"
#include "sandbox/sandbox_handle.hpp"
#include "sandbox/scratch_dir.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadChunk = 64 * 1024;
constexpr int kMaxReadsPerWakeup = 16;
constexpr Millis kDrainGrace{100};
constexpr const char* kSandboxMount = "/sandbox";
constexpr const char* kOldRootName = "/.old_root";
constexpr std::array<const char*, 3> kDeviceNodes = {"/dev/null", "/dev/zero", "/dev/urandom"};

std::string errno_text(const char* what, int err) {
    return std::string{what} + ": " + std::strerror(err);
}

struct Channel {
    UniqueFd supervisor_end;
    UniqueFd child_end;
};

/// Pipe whose read end stays with the supervisor.
Result<Channel> make_output_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return Error{ErrorCode::Io, errno_text("pipe2", errno)};
    Channel ch{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
    if (::fcntl(ch.supervisor_end.get(), F_SETFL, O_NONBLOCK) != 0) {
        return Error{ErrorCode::Io, errno_text("fcntl", errno)};
    }
    return ch;
}

/// Pipe whose write end stays with the supervisor (status, go).
Result<Channel> make_control_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return Error{ErrorCode::Io, errno_text("pipe2", errno)};
    return Channel{UniqueFd{fds[1]}, UniqueFd{fds[0]}};
}

/// stdin is a socket so a program that exits early cannot raise SIGPIPE in us.
Result<Channel> make_stdin_channel() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return Error{ErrorCode::Io, errno_text("socketpair", errno)};
    }
    Channel ch{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
    ::shutdown(ch.supervisor_end.get(), SHUT_RD);
    if (::fcntl(ch.supervisor_end.get(), F_SETFL, O_NONBLOCK) != 0) {
        return Error{ErrorCode::Io, errno_text("fcntl", errno)};
    }
    return ch;
}

// ─────────────────────────────────────────────
// Supervisor
// ─────────────────────────────────────────────

/**
 * @brief Drives one running sandbox until its main process is reaped.
 *
 * Every wakeup (I/O or tick) moves output into the bounded captures, feeds
 * stdin, and checks cancellation, the wall deadline and sampled usage. The
 * first breach kills the group and is the only kill reason recorded.
 */
class Supervisor {
public:
    Supervisor(SandboxHandle& handle, const ResourceBudget& budget,
               const std::optional<std::string>& stdin_data,
               uint32_t tick_ms)
        : handle_(handle)
        , budget_(budget)
        , stdin_data_(stdin_data)
        , tick_ms_(static_cast<int>(tick_ms))
        , sampler_(handle.pid())
        , out_(budget.max_output_bytes)
        , err_(budget.max_output_bytes)
        , buffer_(kReadChunk) {}

    void run(const std::stop_token& stop, Clock::time_point start) {
        const auto deadline = start + Millis{budget_.wall_time_ms};

        while (!handle_.try_reap()) {
            int timeout = tick_ms_;
            if (kill_reason_ == KillReason::None && !report_) {
                auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now()).count();
                timeout = static_cast<int>(std::clamp<int64_t>(left, 0, tick_ms_));
            }

            if (!poll_io(timeout)) {
                io_error_ = errno_text("poll", errno);
                handle_.kill();
                handle_.reap();
                break;
            }

            if (kill_reason_ == KillReason::None && !report_) {
                check_limits(stop, deadline);
            }
        }

        // The leader is gone; anything left in its group is a straggler.
        handle_.kill();
        drain(Clock::now() + kDrainGrace);
        if (auto* cg = handle_.cgroup()) sample_cgroup(*cg);
    }

    [[nodiscard]] KillReason kill_reason() const noexcept { return kill_reason_; }
    [[nodiscard]] const std::optional<ChildReport>& report() const noexcept { return report_; }
    [[nodiscard]] const std::string& io_error() const noexcept { return io_error_; }
    [[nodiscard]] uint64_t peak_memory() const noexcept { return peak_memory_; }
    [[nodiscard]] uint64_t cpu_time_ms() const noexcept { return cpu_time_ms_; }
    [[nodiscard]] bool oom_event() const noexcept { return oom_event_; }
    [[nodiscard]] bool pids_event() const noexcept { return pids_event_; }

    CapturedStream take_stdout() { return std::move(out_).take(); }
    CapturedStream take_stderr() { return std::move(err_).take(); }

private:
    void kill(KillReason reason) {
        if (kill_reason_ == KillReason::None) kill_reason_ = reason;
        handle_.kill();
    }

    bool poll_io(int timeout_ms) {
        std::array<pollfd, 4> fds{};
        std::array<UniqueFd*, 4> owners{};
        nfds_t count = 0;

        auto add = [&](UniqueFd& fd, short events) {
            if (!fd.valid()) return;
            fds[count] = pollfd{fd.get(), events, 0};
            owners[count] = &fd;
            ++count;
        };
        add(handle_.stdout_fd, POLLIN);
        add(handle_.stderr_fd, POLLIN);
        add(handle_.status_fd, POLLIN);
        add(handle_.stdin_fd, POLLOUT);

        int ready = ::poll(count > 0 ? fds.data() : nullptr, count, timeout_ms);
        if (ready < 0) return errno == EINTR;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            UniqueFd& fd = *owners[i];
            if (&fd == &handle_.stdout_fd) {
                read_stream(fd, out_);
            } else if (&fd == &handle_.stderr_fd) {
                read_stream(fd, err_);
            } else if (&fd == &handle_.status_fd) {
                read_status();
            } else {
                feed_stdin();
            }
        }
        return true;
    }

    void read_stream(UniqueFd& fd, BoundedCapture& capture) {
        for (int i = 0; i < kMaxReadsPerWakeup; ++i) {
            ssize_t n = ::read(fd.get(), buffer_.data(), buffer_.size());
            if (n > 0) {
                if (!capture.append(buffer_.data(), static_cast<size_t>(n))) {
                    kill(KillReason::OutputLimit);
                }
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && errno == EAGAIN) return;
            fd.reset();     // EOF or error
            return;
        }
    }

    void read_status() {
        ChildReport report;
        ssize_t n;
        do {
            n = ::read(handle_.status_fd.get(), &report, sizeof(report));
        } while (n < 0 && errno == EINTR);

        if (n < 0 && errno == EAGAIN) return;
        if (n == static_cast<ssize_t>(sizeof(report))) {
            report_ = report;
            handle_.kill();
        }
        // EOF: execve succeeded and closed the child's copy.
        handle_.status_fd.reset();
    }

    void feed_stdin() {
        const std::string& data = *stdin_data_;
        while (stdin_offset_ < data.size()) {
            size_t chunk = std::min(kReadChunk, data.size() - stdin_offset_);
            ssize_t n = ::send(handle_.stdin_fd.get(), data.data() + stdin_offset_, chunk,
                               MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n > 0) {
                stdin_offset_ += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            break;          // program closed its stdin
        }
        handle_.stdin_fd.reset();
    }

    void check_limits(const std::stop_token& stop, Clock::time_point deadline) {
        if (stop.stop_requested()) return kill(KillReason::Cancelled);
        if (Clock::now() >= deadline) return kill(KillReason::WallTime);

        uint64_t memory = 0;
        uint64_t processes = 0;
        if (auto* cg = handle_.cgroup()) {
            auto usage = sample_cgroup(*cg);
            memory = usage.memory_current;
            processes = usage.pids_current;
        } else {
            auto usage = sampler_.sample();
            memory = usage.rss_bytes;
            processes = usage.process_count;
            peak_memory_ = std::max(peak_memory_, usage.rss_bytes);
            cpu_time_ms_ = std::max(cpu_time_ms_, usage.cpu_time_ms);
        }

        if (memory > budget_.memory_bytes) return kill(KillReason::MemoryLimit);
        if (processes > budget_.max_processes + kHelperProcesses) {
            return kill(KillReason::ProcessLimit);
        }
        if (cpu_time_ms_ > budget_.cpu_time_ms) return kill(KillReason::CpuTime);
    }

    CgroupUsage sample_cgroup(const CgroupController& cg) {
        auto usage = cg.usage();
        peak_memory_ = std::max({peak_memory_, usage.memory_peak, usage.memory_current});
        cpu_time_ms_ = std::max(cpu_time_ms_, usage.cpu_usage_usec / 1000);
        oom_event_ = oom_event_ || usage.oom_killed;
        pids_event_ = pids_event_ || usage.pids_limit_hit;
        return usage;
    }

    /// Collect output still buffered in the pipes, bounded by `until`.
    void drain(Clock::time_point until) {
        while (handle_.stdout_fd.valid() || handle_.stderr_fd.valid() || handle_.status_fd.valid()) {
            auto left = std::chrono::duration_cast<Millis>(until - Clock::now()).count();
            if (left <= 0) break;
            handle_.stdin_fd.reset();
            if (!poll_io(static_cast<int>(left))) break;
        }
    }

    SandboxHandle& handle_;
    const ResourceBudget& budget_;
    const std::optional<std::string>& stdin_data_;
    int tick_ms_;
    ProcessGroupSampler sampler_;

    BoundedCapture out_;
    BoundedCapture err_;
    std::vector<char> buffer_;
    size_t stdin_offset_{0};

    KillReason kill_reason_{KillReason::None};
    std::optional<ChildReport> report_;
    std::string io_error_;
    uint64_t peak_memory_{0};
    uint64_t cpu_time_ms_{0};
    bool oom_event_{false};
    bool pids_event_{false};
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// SandboxRunner
// ─────────────────────────────────────────────

SandboxRunner::SandboxRunner(const Config& config, Logger* logger, MetricsCollector* metrics)
    : sandbox_(config.sandbox)
    , languages_(config.languages)
    , logger_(logger)
    , metrics_(metrics) {}

RawOutcome SandboxRunner::execute_raw(const ExecutionJob& job,
                                      const ResourceBudget& budget,
                                      std::stop_token stop) {
    RawOutcome outcome;
    outcome.job_id = job.id;

    auto setup_failed = [&outcome](SetupStage stage, std::string detail) {
        outcome.failed_stage = stage;
        outcome.failure_detail = std::move(detail);
        return outcome;
    };

    // ── Scratch area and source ──────────────
    auto scratch = ScratchDir::create(sandbox_.scratch_root, job.id);
    if (!scratch) return setup_failed(SetupStage::Scratch, scratch.error().message);

    const std::filesystem::path program_dir{kSandboxMount};

    auto launch = languages_.resolve(job.language, program_dir);
    if (!launch) return setup_failed(SetupStage::Exec, launch.error().message);

    if (auto written = scratch->write_file(launch->source_file, job.source); !written) {
        return setup_failed(SetupStage::Scratch, written.error().message);
    }

    // ── cgroup ───────────────────────────────
    std::optional<CgroupController> cgroup;
    if (!sandbox_.cgroup_root.empty()) {
        auto name = "job-" + std::to_string(::getpid()) + "-" + std::to_string(++sequence_);
        auto created = CgroupController::create(sandbox_.cgroup_root, name);
        if (!created) return setup_failed(SetupStage::Cgroup, created.error().message);

        ResourceBudget kernel_budget = budget;
        kernel_budget.max_processes += kHelperProcesses;
        if (auto applied = created->apply(kernel_budget); !applied) {
            return setup_failed(SetupStage::Cgroup, applied.error().message);
        }
        cgroup.emplace(std::move(created).value());
    }

    SandboxHandle handle{std::move(scratch).value(), std::move(cgroup)};

    // ── Pipes ────────────────────────────────
    auto out_pipe = make_output_pipe();
    auto err_pipe = make_output_pipe();
    auto status_pipe = make_control_pipe();
    auto stdin_channel = make_stdin_channel();
    if (!out_pipe || !err_pipe || !status_pipe || !stdin_channel) {
        return setup_failed(SetupStage::Pipes, errno_text("pipe setup", errno));
    }
    // status: the child writes, we read. Swap the roles of the control pipe.
    UniqueFd status_read = std::move(status_pipe->child_end);
    UniqueFd status_write = std::move(status_pipe->supervisor_end);

    std::optional<Channel> go_pipe;
    if (handle.cgroup()) {
        auto go = make_control_pipe();
        if (!go) return setup_failed(SetupStage::Pipes, go.error().message);
        go_pipe.emplace(std::move(go).value());
    }

    // ── Child plan ───────────────────────────
    ChildPlan plan;
    plan.set_argv(launch->argv);

    const std::string home = program_dir.string();
    plan.add_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    plan.add_env("HOME", home);
    plan.add_env("TMPDIR", home);
    plan.add_env("LANG", "C.UTF-8");
    plan.work_dir = plan.intern(home);

    const std::string rootfs = handle.scratch().rootfs_dir().string();
    plan.rootfs = plan.intern(rootfs);
    plan.old_root = plan.intern(rootfs + kOldRootName);
    plan.uid_map = plan.intern("0 " + std::to_string(::getuid()) + " 1");
    plan.gid_map = plan.intern("0 " + std::to_string(::getgid()) + " 1");

    for (const auto& path : launch->readonly_paths) {
        plan.add_bind(path, rootfs + path, false);
    }
    plan.add_bind(handle.scratch().work_dir().string(), rootfs + kSandboxMount, true);
    for (const char* device : kDeviceNodes) {
        plan.add_bind(device, rootfs + device, true);
    }

    const rlim_t cpu_seconds = (budget.cpu_time_ms + 999) / 1000;
    plan.add_rlimit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1);
    if (launch->address_space_factor > 0) {
        const rlim_t address_space = budget.memory_bytes * launch->address_space_factor;
        plan.add_rlimit(RLIMIT_AS, address_space, address_space);
    }
    plan.add_rlimit(RLIMIT_FSIZE, sandbox_.scratch_file_bytes, sandbox_.scratch_file_bytes);
    plan.add_rlimit(RLIMIT_CORE, 0, 0);
    plan.add_rlimit(RLIMIT_NOFILE, sandbox_.open_files, sandbox_.open_files);

    plan.stdin_fd = stdin_channel->child_end.get();
    plan.stdout_fd = out_pipe->child_end.get();
    plan.stderr_fd = err_pipe->child_end.get();
    plan.status_fd = status_write.get();
    plan.go_fd = go_pipe ? go_pipe->child_end.get() : -1;
    plan.supervisor_pid = ::getpid();
    plan.finalize();

    // ── Fork ─────────────────────────────────
    const auto start = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) return setup_failed(SetupStage::Fork, errno_text("fork", errno));
    if (pid == 0) run_child(plan);

    handle.adopt(pid);
    ::setpgid(pid, pid);    // also done by the child; whichever runs first wins

    stdin_channel->child_end.reset();
    out_pipe->child_end.reset();
    err_pipe->child_end.reset();
    status_write.reset();

    handle.stdout_fd = std::move(out_pipe->supervisor_end);
    handle.stderr_fd = std::move(err_pipe->supervisor_end);
    handle.status_fd = std::move(status_read);
    if (job.stdin_data && !job.stdin_data->empty()) {
        handle.stdin_fd = std::move(stdin_channel->supervisor_end);
    } else {
        stdin_channel->supervisor_end.reset();
    }

    if (go_pipe) {
        go_pipe->child_end.reset();
        if (auto attached = handle.cgroup()->attach(pid); !attached) {
            return setup_failed(SetupStage::Cgroup, attached.error().message);
        }
        const char go = 1;
        if (::write(go_pipe->supervisor_end.get(), &go, 1) != 1) {
            return setup_failed(SetupStage::Fork, errno_text("release child", errno));
        }
        go_pipe->supervisor_end.reset();
    }

    // ── Supervise ────────────────────────────
    Supervisor supervisor{handle, budget, job.stdin_data, sandbox_.tick_ms};
    supervisor.run(stop, start);
    outcome.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);

    if (const auto& report = supervisor.report()) {
        outcome.failed_stage = report->stage;
        outcome.failure_detail = errno_text(to_string(report->stage).data(), report->error);
    } else if (!supervisor.io_error().empty()) {
        outcome.failed_stage = SetupStage::Supervise;
        outcome.failure_detail = supervisor.io_error();
    }

    const int status = handle.wait_status();
    outcome.kill_reason = supervisor.kill_reason();
    outcome.exited = WIFEXITED(status);
    outcome.exit_code = outcome.exited ? WEXITSTATUS(status) : 0;
    outcome.signaled = WIFSIGNALED(status);
    outcome.term_signal = outcome.signaled ? WTERMSIG(status) : 0;
    outcome.oom_event = supervisor.oom_event();
    outcome.pids_event = supervisor.pids_event();

    const auto& usage = handle.usage();
    const uint64_t rusage_cpu_ms =
        static_cast<uint64_t>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000
        + static_cast<uint64_t>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
    outcome.cpu_time = Millis{std::max(supervisor.cpu_time_ms(), rusage_cpu_ms)};
    outcome.peak_memory_bytes = std::max(supervisor.peak_memory(),
                                         static_cast<uint64_t>(usage.ru_maxrss) * 1024);

    outcome.out = supervisor.take_stdout();
    outcome.err = supervisor.take_stderr();
    return outcome;
}

ExecutionResult SandboxRunner::run(const ExecutionJob& job,
                                   const ResourceBudget& budget,
                                   std::stop_token stop) {
    auto raw = execute_raw(job, budget, std::move(stop));
    if (raw.failed_stage != SetupStage::None) {
        if (logger_) {
            logger_->error("Sandbox failure", {
                {"job_id", job.id},
                {"stage", std::string{to_string(raw.failed_stage)}},
                {"detail", raw.failure_detail}
            });
        }
        if (metrics_) metrics_->record_sandbox_failure(job.id, to_string(raw.failed_stage));
    }
    return verdicts_.build(std::move(raw), budget);
}

}  // namespace runbox
