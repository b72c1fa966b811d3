/**
 * @file output_capture.hpp
 * @brief Byte-counting capture of one sandbox output stream.
 */

#pragma once

#include "sandbox/raw_outcome.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace runbox {

/**
 * @brief Keeps at most `limit` bytes and flags the first byte past it.
 *
 * Memory held never exceeds the limit, whatever the producer writes.
 */
class BoundedCapture {
public:
    explicit BoundedCapture(uint64_t limit);

    /// Returns false once the limit has been exceeded.
    bool append(const char* data, size_t len);

    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] uint64_t limit() const noexcept { return limit_; }

    [[nodiscard]] CapturedStream take() &&;

private:
    uint64_t limit_;
    std::string buffer_;
    bool truncated_{false};
};

}  // namespace runbox
