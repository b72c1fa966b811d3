/**
 * @file request_codec.hpp
 * @brief JSON request parsing and response encoding.
 *
 * Requests:
 *   {"op":"execute","language":"python","source":"...","stdin":"...",
 *    "limitsOverride":{"cpuTimeMs":..,"wallTimeMs":..,"memoryBytes":..,
 *                      "maxOutputBytes":..,"maxProcesses":..},
 *    "submitter":"...","jobId":"..."}
 *   {"op":"cancel","jobId":"..."}
 *   {"op":"health"}
 *
 * Every response carries an HTTP-style "status".
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "service/execution_service.hpp"

#include <string>
#include <string_view>

namespace runbox {

enum class RequestOp : uint8_t {
    Execute,
    Cancel,
    Health
};

struct ApiRequest {
    RequestOp op{RequestOp::Health};
    SubmissionRequest execute;      ///< op == Execute
    JobId job_id;                   ///< op == Cancel
};

/**
 * @brief Parse one request payload.
 *
 * Errors: InvalidRequest (not JSON, wrong types, unknown op), UnsupportedLanguage,
 * InvalidBudget (negative limits).
 */
[[nodiscard]] Result<ApiRequest> parse_request(std::string_view payload);

/// HTTP-style status for an error returned at admission or delivery.
[[nodiscard]] int status_for(ErrorCode code) noexcept;

/// HTTP-style status for a finished execution.
[[nodiscard]] int status_for(TerminalState state) noexcept;

[[nodiscard]] std::string encode_result(const ExecutionResult& result);
[[nodiscard]] std::string encode_error(const Error& error);
[[nodiscard]] std::string encode_cancel(const JobId& id, CancelOutcome outcome);
[[nodiscard]] std::string encode_health(const ServiceStats& stats);

}  // namespace runbox
