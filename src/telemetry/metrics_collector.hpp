/**
 * @file metrics_collector.hpp
 * @brief Structured service events as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>

namespace runbox {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Events: job_admitted, job_rejected, job_finished, job_cancelled,
 * sandbox_failure, service_stats.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_admission(const JobId& id, std::string_view decision, size_t queue_position);
    void record_rejection(std::string_view reason);
    void record_finished(const ExecutionResult& result);
    void record_cancelled(const JobId& id, std::string_view outcome);
    void record_sandbox_failure(const JobId& id, std::string_view stage);
    void record_service_stats(size_t workers, size_t busy, size_t queued,
                              uint64_t completed, uint64_t rejected);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace runbox
