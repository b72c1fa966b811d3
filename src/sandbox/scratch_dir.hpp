/**
 * @file scratch_dir.hpp
 * @brief Private per-job working area, removed on destruction.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>

namespace runbox {

/**
 * @brief Owns `<root>/<job>-XXXXXX/` with a writable `work/` directory and an
 *        empty `rootfs/` mount point for namespace isolation.
 *
 * Move-only. The whole tree is removed exactly once, when the owner dies.
 */
class ScratchDir {
public:
    static Result<ScratchDir> create(const std::filesystem::path& root, const JobId& job_id);

    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return base_; }
    [[nodiscard]] std::filesystem::path work_dir() const { return base_ / "work"; }
    [[nodiscard]] std::filesystem::path rootfs_dir() const { return base_ / "rootfs"; }

    /// Write a file inside work/ with mode 0644.
    Result<void> write_file(std::string_view name, std::string_view content) const;

    /// Remove the tree now. Idempotent.
    void remove() noexcept;

private:
    explicit ScratchDir(std::filesystem::path base);

    std::filesystem::path base_;
};

}  // namespace runbox
