/**
 * @file execution_queue.hpp
 * @brief Bounded FIFO of jobs waiting for a worker.
 *
 * Not synchronised; the owning ExecutionService guards it with its mutex.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace runbox {

/**
 * @brief A job waiting for a worker, with everything needed to deliver its result.
 */
struct QueueSlot {
    std::shared_ptr<const ExecutionJob> job;
    SteadyTime arrived_at;
    uint64_t sequence{0};
    std::promise<Result<ExecutionResult>> promise;
    std::stop_source stop;
};

/**
 * @brief Dispatch order is arrival time, ties broken by job id.
 *
 * A list keeps positions stable and an id index makes removal O(1), so
 * cancelling a waiting job never disturbs the others' order.
 */
class ExecutionQueue {
public:
    explicit ExecutionQueue(size_t capacity);

    /// Insert in arrival order. Returns the 1-based position, or nullopt when full.
    [[nodiscard]] std::optional<size_t> push(QueueSlot slot);

    /// Remove and return the head.
    [[nodiscard]] std::optional<QueueSlot> pop();

    /// Remove a waiting job by id.
    [[nodiscard]] std::optional<QueueSlot> remove(const JobId& id);

    /// 1-based position of a waiting job. Linear in the queue depth.
    [[nodiscard]] std::optional<size_t> position(const JobId& id) const;

    /// Empty the queue, head first.
    [[nodiscard]] std::vector<QueueSlot> drain();

    [[nodiscard]] bool contains(const JobId& id) const { return index_.contains(id); }
    [[nodiscard]] size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }
    [[nodiscard]] bool full() const noexcept { return slots_.size() >= capacity_; }

private:
    size_t capacity_;
    std::list<QueueSlot> slots_;
    std::unordered_map<JobId, std::list<QueueSlot>::iterator> index_;
};

}  // namespace runbox
