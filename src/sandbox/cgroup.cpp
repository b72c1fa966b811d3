/**
 * @file cgroup.cpp
 * @brief CgroupController implementation.
 */

#include "sandbox/cgroup.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

namespace runbox {

uint64_t parse_flat_keyed(const std::string& content, const std::string& key) {
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        auto space = line.find(' ');
        if (space == std::string::npos) continue;
        if (line.compare(0, space, key) != 0) continue;
        try {
            return std::stoull(line.substr(space + 1));
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

Result<CgroupController> CgroupController::create(const std::filesystem::path& root,
                                                  const std::string& name) {
    if (!std::filesystem::exists(root / "cgroup.controllers")) {
        return Error{ErrorCode::SandboxSetup,
                     "Not a cgroup v2 directory: " + root.string()};
    }

    // Best effort: the controllers may already be enabled by the delegator.
    {
        std::ofstream subtree(root / "cgroup.subtree_control");
        if (subtree) subtree << "+memory +pids +cpu";
    }

    auto path = root / name;
    if (::mkdir(path.c_str(), 0755) != 0) {
        return Error{ErrorCode::SandboxSetup,
                     "Cannot create cgroup " + path.string() + ": " + std::strerror(errno)};
    }
    return CgroupController{std::move(path)};
}

CgroupController::CgroupController(std::filesystem::path path) : path_(std::move(path)) {}

CgroupController::~CgroupController() {
    destroy();
}

CgroupController::CgroupController(CgroupController&& other) noexcept
    : path_(std::exchange(other.path_, std::filesystem::path{})) {}

CgroupController& CgroupController::operator=(CgroupController&& other) noexcept {
    if (this != &other) {
        destroy();
        path_ = std::exchange(other.path_, std::filesystem::path{});
    }
    return *this;
}

Result<void> CgroupController::apply(const ResourceBudget& budget) {
    if (auto r = write_file("memory.max", std::to_string(budget.memory_bytes)); !r) return r;
    if (auto r = write_file("memory.swap.max", "0"); !r) return r;
    if (auto r = write_file("pids.max", std::to_string(budget.max_processes)); !r) return r;
    return Result<void>{};
}

Result<void> CgroupController::attach(pid_t pid) {
    return write_file("cgroup.procs", std::to_string(pid));
}

CgroupUsage CgroupController::usage() const {
    CgroupUsage usage;
    usage.memory_current = read_u64("memory.current");
    usage.memory_peak = read_u64("memory.peak");
    usage.pids_current = read_u64("pids.current");
    usage.cpu_usage_usec = parse_flat_keyed(read_file("cpu.stat"), "usage_usec");
    usage.oom_killed = parse_flat_keyed(read_file("memory.events"), "oom_kill") > 0;
    usage.pids_limit_hit = parse_flat_keyed(read_file("pids.events"), "max") > 0;
    return usage;
}

void CgroupController::kill_all() noexcept {
    if (path_.empty()) return;
    std::ofstream file(path_ / "cgroup.kill");
    if (file) file << "1";
}

void CgroupController::destroy() noexcept {
    if (path_.empty()) return;
    kill_all();

    // rmdir fails with EBUSY until the last member has been reaped.
    for (int attempt = 0; attempt < 100; ++attempt) {
        if (::rmdir(path_.c_str()) == 0 || errno == ENOENT) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    path_.clear();
}

Result<void> CgroupController::write_file(const char* name, const std::string& content) const {
    auto file_path = path_ / name;
    std::ofstream file(file_path);
    if (!file) {
        return Error{ErrorCode::SandboxSetup, "Cannot open " + file_path.string()};
    }
    file << content;
    file.flush();
    if (!file) {
        return Error{ErrorCode::SandboxSetup, "Write failed: " + file_path.string()};
    }
    return Result<void>{};
}

std::string CgroupController::read_file(const char* name) const {
    std::ifstream file(path_ / name);
    if (!file) return {};
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

uint64_t CgroupController::read_u64(const char* name) const {
    auto content = read_file(name);
    if (content.empty() || content.starts_with("max")) return 0;
    try {
        return std::stoull(content);
    } catch (const std::exception&) {
        return 0;
    }
}

}  // namespace runbox
