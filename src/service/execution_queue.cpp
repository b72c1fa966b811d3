/**
 * @file execution_queue.cpp
 * @brief ExecutionQueue implementation.
 */

#include "service/execution_queue.hpp"

#include <iterator>
#include <tuple>

namespace runbox {

namespace {

bool dispatches_before(const QueueSlot& a, const QueueSlot& b) {
    return std::tie(a.arrived_at, a.job->id) < std::tie(b.arrived_at, b.job->id);
}

}  // anonymous namespace

ExecutionQueue::ExecutionQueue(size_t capacity) : capacity_(capacity) {}

std::optional<size_t> ExecutionQueue::push(QueueSlot slot) {
    if (full() || !slot.job) return std::nullopt;

    // Arrivals are almost always in order, so scan from the tail.
    auto pos = slots_.end();
    while (pos != slots_.begin() && dispatches_before(slot, *std::prev(pos))) {
        --pos;
    }

    const JobId id = slot.job->id;
    auto it = slots_.insert(pos, std::move(slot));
    index_[id] = it;
    return static_cast<size_t>(std::distance(slots_.begin(), it)) + 1;
}

std::optional<QueueSlot> ExecutionQueue::pop() {
    if (slots_.empty()) return std::nullopt;
    QueueSlot slot = std::move(slots_.front());
    index_.erase(slot.job->id);
    slots_.pop_front();
    return slot;
}

std::optional<QueueSlot> ExecutionQueue::remove(const JobId& id) {
    auto found = index_.find(id);
    if (found == index_.end()) return std::nullopt;
    QueueSlot slot = std::move(*found->second);
    slots_.erase(found->second);
    index_.erase(found);
    return slot;
}

std::optional<size_t> ExecutionQueue::position(const JobId& id) const {
    auto found = index_.find(id);
    if (found == index_.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(slots_.cbegin(),
                                             std::list<QueueSlot>::const_iterator{found->second})) + 1;
}

std::vector<QueueSlot> ExecutionQueue::drain() {
    std::vector<QueueSlot> out;
    out.reserve(slots_.size());
    for (auto& slot : slots_) {
        out.push_back(std::move(slot));
    }
    slots_.clear();
    index_.clear();
    return out;
}

}  // namespace runbox
