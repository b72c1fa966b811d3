/**
 * @file child_process.cpp
 * @brief ChildPlan preparation and the post-fork child path.
 *
 * The job gets a minimal root on tmpfs: the runtime paths bound read-only,
 * its work directory bound writable at /sandbox, three device nodes, then
 * pivot_root into it. The process forked after unshare(CLONE_NEWPID) is PID 1
 * of the job; it forks the program, reaps whatever is reparented to it and
 * reports the program's wait status back to the leader.
 */

#include "sandbox/child_process.hpp"

#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <system_error>

#ifndef CLOSE_RANGE_CLOEXEC
#define CLOSE_RANGE_CLOEXEC (1U << 2)
#endif

namespace runbox {

// ─────────────────────────────────────────────
// ChildPlan (parent side, before fork)
// ─────────────────────────────────────────────

const char* ChildPlan::intern(std::string value) {
    storage_.push_back(std::move(value));
    return storage_.back().c_str();
}

void ChildPlan::set_argv(const std::vector<std::string>& args) {
    argv.clear();
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(intern(arg)));
    }
}

void ChildPlan::add_env(const std::string& key, const std::string& value) {
    envp.push_back(const_cast<char*>(intern(key + "=" + value)));
}

void ChildPlan::add_bind(const std::string& host_path, const std::string& target_path,
                         bool writable) {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto status = fs::symlink_status(host_path, ec);
    if (ec || !fs::exists(status)) return;

    MountSpec spec;
    spec.source = intern(host_path);
    spec.target = intern(target_path);
    spec.writable = writable;

    if (fs::is_symlink(status)) {
        auto link = fs::read_symlink(host_path, ec);
        if (ec) return;
        spec.kind = MountSpec::Kind::Symlink;
        spec.link_target = intern(link.string());
    } else {
        spec.kind = fs::is_directory(status) ? MountSpec::Kind::Directory
                                             : MountSpec::Kind::File;
        // In a user namespace a remount must keep the flags the source mount
        // was locked with, otherwise the kernel refuses it.
        struct statvfs sv {};
        if (::statvfs(host_path.c_str(), &sv) == 0) {
            if (sv.f_flag & ST_NOSUID) spec.locked_flags |= MS_NOSUID;
            if (sv.f_flag & ST_NODEV)  spec.locked_flags |= MS_NODEV;
            if (sv.f_flag & ST_NOEXEC) spec.locked_flags |= MS_NOEXEC;
            if (sv.f_flag & ST_RDONLY) spec.locked_flags |= MS_RDONLY;
        }
    }
    mounts.push_back(spec);
}

void ChildPlan::add_rlimit(int resource, rlim_t soft, rlim_t hard) {
    RlimitSpec spec;
    spec.resource = resource;
    spec.value.rlim_cur = soft;
    spec.value.rlim_max = hard;
    rlimits.push_back(spec);
}

void ChildPlan::finalize() {
    argv.push_back(nullptr);
    envp.push_back(nullptr);
}

// ─────────────────────────────────────────────
// Child side (after fork, async-signal-safe only)
// ─────────────────────────────────────────────

namespace {

[[noreturn]] void fail(const ChildPlan& plan, SetupStage stage, int err) noexcept {
    ChildReport report{stage, err};
    if (plan.status_fd >= 0) {
        ssize_t n;
        do {
            n = ::write(plan.status_fd, &report, sizeof(report));
        } while (n < 0 && errno == EINTR);
    }
    ::_exit(127);
}

bool write_text(const char* path, const char* text) noexcept {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    size_t len = std::strlen(text);
    bool ok = ::write(fd, text, len) == static_cast<ssize_t>(len);
    int saved = errno;
    ::close(fd);
    errno = saved;
    return ok;
}

bool make_dirs(const char* path, size_t len) noexcept {
    char buf[PATH_MAX];
    if (len >= sizeof(buf)) {
        errno = ENAMETOOLONG;
        return false;
    }
    std::memcpy(buf, path, len);
    buf[len] = '\0';
    for (size_t i = 1; i <= len; ++i) {
        if (buf[i] != '/' && buf[i] != '\0') continue;
        char saved = buf[i];
        buf[i] = '\0';
        if (::mkdir(buf, 0755) != 0 && errno != EEXIST) return false;
        buf[i] = saved;
    }
    return true;
}

bool make_dirs(const char* path) noexcept {
    return make_dirs(path, std::strlen(path));
}

bool make_parent_dirs(const char* path) noexcept {
    const char* slash = std::strrchr(path, '/');
    if (slash == nullptr || slash == path) return true;
    return make_dirs(path, static_cast<size_t>(slash - path));
}

bool mount_one(const MountSpec& m) noexcept {
    switch (m.kind) {
        case MountSpec::Kind::Symlink:
            if (!make_parent_dirs(m.target)) return false;
            return ::symlink(m.link_target, m.target) == 0 || errno == EEXIST;

        case MountSpec::Kind::Directory:
            if (!make_dirs(m.target)) return false;
            break;

        case MountSpec::Kind::File: {
            if (!make_parent_dirs(m.target)) return false;
            int fd = ::open(m.target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) return false;
            ::close(fd);
            break;
        }
    }

    if (::mount(m.source, m.target, nullptr, MS_BIND | MS_REC, nullptr) != 0) return false;
    if (m.writable) return true;

    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | m.locked_flags;
    return ::mount(nullptr, m.target, nullptr, flags, nullptr) == 0;
}

void enter_namespaces(const ChildPlan& plan) noexcept {
    constexpr int kFlags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWNET
                         | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
    if (::unshare(kFlags) != 0) fail(plan, SetupStage::Namespaces, errno);

    if (!write_text("/proc/self/setgroups", "deny") && errno != ENOENT) {
        fail(plan, SetupStage::Namespaces, errno);
    }
    if (!write_text("/proc/self/uid_map", plan.uid_map)) fail(plan, SetupStage::Namespaces, errno);
    if (!write_text("/proc/self/gid_map", plan.gid_map)) fail(plan, SetupStage::Namespaces, errno);

    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        fail(plan, SetupStage::Filesystem, errno);
    }
    if (::mount("tmpfs", plan.rootfs, "tmpfs", MS_NOSUID | MS_NODEV, "size=1m,mode=0755") != 0) {
        fail(plan, SetupStage::Filesystem, errno);
    }
    for (const auto& m : plan.mounts) {
        if (!mount_one(m)) fail(plan, SetupStage::Filesystem, errno);
    }

    if (!make_dirs(plan.old_root)) fail(plan, SetupStage::Filesystem, errno);
    if (::syscall(SYS_pivot_root, plan.rootfs, plan.old_root) != 0) {
        fail(plan, SetupStage::Filesystem, errno);
    }
    if (::chdir("/") != 0) fail(plan, SetupStage::Filesystem, errno);

    const char* old_root_inside = std::strrchr(plan.old_root, '/');
    if (::umount2(old_root_inside, MNT_DETACH) != 0) fail(plan, SetupStage::Filesystem, errno);
    ::rmdir(old_root_inside);

    if (::mount(nullptr, "/", nullptr,
                MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
        fail(plan, SetupStage::Filesystem, errno);
    }

    static constexpr char kHostname[] = "runbox";
    ::sethostname(kHostname, sizeof(kHostname) - 1);
}

bool read_status(int fd, int& status) noexcept {
    ssize_t n;
    do {
        n = ::read(fd, &status, sizeof(status));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(status));
}

/// Leader: wait for init, then end the same way the program did.
[[noreturn]] void mirror_exit(pid_t init, int report_fd) noexcept {
    int status = 0;
    while (::waitpid(init, &status, 0) < 0) {
        if (errno != EINTR) ::_exit(127);
    }
    // Without a report init itself was killed; mirror that instead.
    int program_status = 0;
    if (read_status(report_fd, program_status)) status = program_status;

    if (WIFEXITED(status)) ::_exit(WEXITSTATUS(status));

    int sig = WTERMSIG(status);
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigaction(sig, &dfl, nullptr);
    sigset_t set;
    ::sigemptyset(&set);
    ::sigaddset(&set, sig);
    ::sigprocmask(SIG_UNBLOCK, &set, nullptr);
    ::kill(::getpid(), sig);
    ::_exit(128 + sig);
}

void reset_signals() noexcept {
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig == SIGKILL || sig == SIGSTOP) continue;
        ::sigaction(sig, &dfl, nullptr);
    }
    sigset_t empty;
    ::sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
}

long max_fd_hint() noexcept {
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    return (max_fd < 0 || max_fd > 65536) ? 65536 : max_fd;
}

void mark_inherited_fds_cloexec() noexcept {
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
#endif
    for (int fd = 3, end = static_cast<int>(max_fd_hint()); fd < end; ++fd) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

/**
 * The leader and init never exec; drop every descriptor they inherited,
 * including pipe ends of sandboxes forked concurrently by other workers.
 * Returns the new number of `keep`, which is moved to 3.
 */
int keep_only_fd(int keep) noexcept {
    constexpr int kKept = 3;
    if (keep != kKept) {
        if (::dup2(keep, kKept) < 0) ::_exit(127);
        ::close(keep);
    }
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, kKept + 1U, ~0U, 0U) == 0) return kKept;
#endif
    for (int fd = kKept + 1, end = static_cast<int>(max_fd_hint()); fd < end; ++fd) {
        ::close(fd);
    }
    return kKept;
}

[[noreturn]] void exec_program(const ChildPlan& plan) noexcept {
    if (::dup2(plan.stdin_fd, STDIN_FILENO) < 0
        || ::dup2(plan.stdout_fd, STDOUT_FILENO) < 0
        || ::dup2(plan.stderr_fd, STDERR_FILENO) < 0) {
        fail(plan, SetupStage::Redirect, errno);
    }

    if (::chdir(plan.work_dir) != 0) fail(plan, SetupStage::Filesystem, errno);

    reset_signals();
    mark_inherited_fds_cloexec();

    ::execve(plan.argv[0], plan.argv.data(), plan.envp.data());
    fail(plan, SetupStage::Exec, errno);
}

/**
 * PID 1 of the job. Signals without a handler never reach it from inside the
 * namespace, so it cannot be stopped by the program; only the supervisor's
 * SIGKILL (or the leader's death) ends it early.
 */
[[noreturn]] void run_init(const ChildPlan& plan, int report_fd) noexcept {
    pid_t program = ::fork();
    if (program < 0) fail(plan, SetupStage::Fork, errno);
    if (program == 0) {
        ::close(report_fd);
        exec_program(plan);
    }

    report_fd = keep_only_fd(report_fd);

    int status = 0;
    for (;;) {
        int reaped_status = 0;
        pid_t reaped = ::waitpid(-1, &reaped_status, 0);
        if (reaped == program) {
            status = reaped_status;
            break;
        }
        if (reaped < 0 && errno != EINTR) ::_exit(127);
    }

    ssize_t n;
    do {
        n = ::write(report_fd, &status, sizeof(status));
    } while (n < 0 && errno == EINTR);
    // Exiting tears down the namespace and every process still in it.
    ::_exit(0);
}

}  // anonymous namespace

void run_child(const ChildPlan& plan) noexcept {
    ::setpgid(0, 0);

    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) fail(plan, SetupStage::Fork, errno);
    if (::getppid() != plan.supervisor_pid) ::_exit(127);

    if (plan.go_fd >= 0) {
        char go = 0;
        ssize_t n;
        do {
            n = ::read(plan.go_fd, &go, 1);
        } while (n < 0 && errno == EINTR);
        if (n != 1) ::_exit(127);       // supervisor gave up on this sandbox
    }

    enter_namespaces(plan);

    for (const auto& limit : plan.rlimits) {
        if (::setrlimit(limit.resource, &limit.value) != 0) {
            fail(plan, SetupStage::Rlimits, errno);
        }
    }

    int report[2];
    if (::pipe2(report, O_CLOEXEC) != 0) fail(plan, SetupStage::Fork, errno);

    pid_t init = ::fork();
    if (init < 0) fail(plan, SetupStage::Fork, errno);
    if (init > 0) {
        ::close(report[1]);
        mirror_exit(init, keep_only_fd(report[0]));
    }

    ::close(report[0]);
    // Killing the leader, as the supervisor does, takes the namespace with it.
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    run_init(plan, report[1]);
}

}  // namespace runbox
