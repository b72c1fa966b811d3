/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace runbox {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_admission(const JobId& id, std::string_view decision,
                                        size_t queue_position) {
    std::ostringstream oss;
    oss << R"({"event":"job_admitted")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"decision":")" << decision << "\""
        << R"(,"queue_position":)" << queue_position
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_rejection(std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"job_rejected")"
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_finished(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"job_finished")"
        << R"(,"job":")" << json_escape(result.job_id) << "\""
        << R"(,"state":")" << to_string(result.state) << "\""
        << R"(,"elapsed_ms":)" << result.elapsed.count()
        << R"(,"cpu_ms":)" << result.cpu_time.count()
        << R"(,"peak_memory_bytes":)" << result.peak_memory_bytes
        << R"(,"stdout_truncated":)" << (result.stdout_truncated ? "true" : "false")
        << R"(,"stderr_truncated":)" << (result.stderr_truncated ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cancelled(const JobId& id, std::string_view outcome) {
    std::ostringstream oss;
    oss << R"({"event":"job_cancelled")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"outcome":")" << outcome << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_sandbox_failure(const JobId& id, std::string_view stage) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_failure")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"stage":")" << stage << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_service_stats(size_t workers, size_t busy, size_t queued,
                                            uint64_t completed, uint64_t rejected) {
    std::ostringstream oss;
    oss << R"({"event":"service_stats")"
        << R"(,"workers":)" << workers
        << R"(,"busy":)" << busy
        << R"(,"queued":)" << queued
        << R"(,"completed":)" << completed
        << R"(,"rejected":)" << rejected
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace runbox
