/**
 * @file output_capture.cpp
 * @brief BoundedCapture implementation.
 */

#include "sandbox/output_capture.hpp"

#include <algorithm>
#include <utility>

namespace runbox {

BoundedCapture::BoundedCapture(uint64_t limit) : limit_(limit) {}

bool BoundedCapture::append(const char* data, size_t len) {
    if (truncated_) return false;

    const uint64_t room = limit_ - buffer_.size();
    if (len <= room) {
        buffer_.append(data, len);
        return true;
    }

    buffer_.append(data, static_cast<size_t>(room));
    truncated_ = true;
    return false;
}

CapturedStream BoundedCapture::take() && {
    return CapturedStream{std::move(buffer_), truncated_};
}

}  // namespace runbox
