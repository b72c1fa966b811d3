/**
 * @file scratch_dir.cpp
 * @brief ScratchDir implementation.
 */

#include "sandbox/scratch_dir.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace runbox {

namespace {

/// Job ids come from callers; keep only characters safe in a path component.
std::string sanitize(std::string_view id) {
    std::string out;
    for (char c : id) {
        if (out.size() >= 48) break;
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                 || (c >= '0' && c <= '9') || c == '-' || c == '_';
        out += safe ? c : '_';
    }
    return out.empty() ? std::string{"job"} : out;
}

}  // anonymous namespace

Result<ScratchDir> ScratchDir::create(const std::filesystem::path& root, const JobId& job_id) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create scratch root " + root.string()
                                    + ": " + ec.message()};
    }

    auto templ = (root / (sanitize(job_id) + "-XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        return Error{ErrorCode::Io, "mkdtemp failed under " + root.string()
                                    + ": " + std::strerror(errno)};
    }

    ScratchDir dir{std::filesystem::path{buf.data()}};
    for (const char* sub : {"work", "rootfs"}) {
        if (::mkdir((dir.base_ / sub).c_str(), 0700) != 0) {
            return Error{ErrorCode::Io, "Cannot create " + (dir.base_ / sub).string()
                                        + ": " + std::strerror(errno)};
        }
    }
    return dir;
}

ScratchDir::ScratchDir(std::filesystem::path base) : base_(std::move(base)) {}

ScratchDir::~ScratchDir() {
    remove();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : base_(std::exchange(other.base_, std::filesystem::path{})) {}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        base_ = std::exchange(other.base_, std::filesystem::path{});
    }
    return *this;
}

Result<void> ScratchDir::write_file(std::string_view name, std::string_view content) const {
    auto path = work_dir() / std::string{name};
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{ErrorCode::Io, "Cannot create " + path.string() + ": " + std::strerror(errno)};
    }

    const char* ptr = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        auto written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            return Error{ErrorCode::Io, "Write failed on " + path.string() + ": " + std::strerror(saved)};
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::close(fd) != 0) {
        return Error{ErrorCode::Io, "Close failed on " + path.string() + ": " + std::strerror(errno)};
    }
    return Result<void>{};
}

void ScratchDir::remove() noexcept {
    if (base_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(base_, ec);
    if (ec) {
        // The program may have revoked its own permissions on subdirectories.
        namespace fs = std::filesystem;
        std::error_code walk_ec;
        fs::permissions(base_, fs::perms::owner_all, fs::perm_options::add, walk_ec);
        for (fs::recursive_directory_iterator it(base_, fs::directory_options::skip_permission_denied, walk_ec), end;
             !walk_ec && it != end; it.increment(walk_ec)) {
            if (it->is_directory(walk_ec) && !it->is_symlink(walk_ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, walk_ec);
            }
        }
        std::filesystem::remove_all(base_, ec);
    }
    base_.clear();
}

}  // namespace runbox
