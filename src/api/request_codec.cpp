/**
 * @file request_codec.cpp
 * @brief Request codec implementation on nlohmann::json.
 */

#include "api/request_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace runbox {

using json = nlohmann::json;

namespace {

constexpr std::string_view kSandboxFailureMessage =
    "The execution service could not run this job; it has been reported.";

Result<std::optional<std::string>> optional_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidRequest, std::string{"Field '"} + key + "' must be a string"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

Result<std::optional<uint64_t>> optional_limit(const json& limits, const char* key) {
    auto it = limits.find(key);
    if (it == limits.end() || it->is_null()) return std::optional<uint64_t>{};
    if (it->is_number_unsigned()) return std::optional<uint64_t>{it->get<uint64_t>()};
    if (it->is_number_integer()) {
        return Error{ErrorCode::InvalidBudget, std::string{key} + " must not be negative"};
    }
    return Error{ErrorCode::InvalidRequest, std::string{"Limit '"} + key + "' must be an integer"};
}

Result<PartialBudget> parse_limits(const json& body) {
    PartialBudget budget;
    auto it = body.find("limitsOverride");
    if (it == body.end() || it->is_null()) return budget;
    if (!it->is_object()) {
        return Error{ErrorCode::InvalidRequest, "Field 'limitsOverride' must be an object"};
    }

    struct Field {
        const char* key;
        std::optional<uint64_t> PartialBudget::* member;
    };
    static constexpr Field kFields[] = {
        {"cpuTimeMs", &PartialBudget::cpu_time_ms},
        {"wallTimeMs", &PartialBudget::wall_time_ms},
        {"memoryBytes", &PartialBudget::memory_bytes},
        {"maxOutputBytes", &PartialBudget::max_output_bytes},
        {"maxProcesses", &PartialBudget::max_processes},
    };
    for (const auto& field : kFields) {
        auto value = optional_limit(*it, field.key);
        if (!value) return value.error();
        budget.*field.member = *value;
    }
    return budget;
}

Result<ApiRequest> parse_execute(const json& body) {
    ApiRequest request;
    request.op = RequestOp::Execute;

    auto lang_it = body.find("language");
    if (lang_it == body.end() || !lang_it->is_string()) {
        return Error{ErrorCode::InvalidRequest, "Field 'language' is required"};
    }
    auto tag = lang_it->get<std::string>();
    auto language = parse_language(tag);
    if (!language) {
        return Error{ErrorCode::UnsupportedLanguage, "Unsupported language: " + tag};
    }
    request.execute.language = *language;

    auto src_it = body.find("source");
    if (src_it == body.end() || !src_it->is_string()) {
        return Error{ErrorCode::InvalidRequest, "Field 'source' is required"};
    }
    request.execute.source = src_it->get<std::string>();

    auto stdin_data = optional_string(body, "stdin");
    if (!stdin_data) return stdin_data.error();
    request.execute.stdin_data = *stdin_data;

    auto submitter = optional_string(body, "submitter");
    if (!submitter) return submitter.error();
    request.execute.submitter = submitter->value_or("");

    auto job_id = optional_string(body, "jobId");
    if (!job_id) return job_id.error();
    if (*job_id && (*job_id)->empty()) {
        return Error{ErrorCode::InvalidRequest, "Field 'jobId' must not be empty"};
    }
    request.execute.job_id = *job_id;

    auto limits = parse_limits(body);
    if (!limits) return limits.error();
    request.execute.limits_override = *limits;
    return request;
}

json result_body(const ExecutionResult& result) {
    json body = {
        {"jobId", result.job_id},
        {"state", std::string{to_string(result.state)}},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"stdoutTruncated", result.stdout_truncated},
        {"stderrTruncated", result.stderr_truncated},
        {"exitCode", nullptr},
        {"elapsedMs", result.elapsed.count()},
        {"cpuTimeMs", result.cpu_time.count()},
        {"peakMemoryBytes", result.peak_memory_bytes},
    };
    if (result.exit_code) body["exitCode"] = *result.exit_code;
    if (result.signal) body["signal"] = *result.signal;
    return body;
}

}  // anonymous namespace

Result<ApiRequest> parse_request(std::string_view payload) {
    json body;
    try {
        body = json::parse(payload);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidRequest, std::string{"Malformed JSON: "} + e.what()};
    }
    if (!body.is_object()) {
        return Error{ErrorCode::InvalidRequest, "Request must be a JSON object"};
    }

    std::string op = "execute";
    if (auto it = body.find("op"); it != body.end()) {
        if (!it->is_string()) return Error{ErrorCode::InvalidRequest, "Field 'op' must be a string"};
        op = it->get<std::string>();
    }
    if (op == "execute") return parse_execute(body);

    ApiRequest request;
    if (op == "health") {
        request.op = RequestOp::Health;
        return request;
    }
    if (op == "cancel") {
        auto id = optional_string(body, "jobId");
        if (!id) return id.error();
        if (!*id || (*id)->empty()) {
            return Error{ErrorCode::InvalidRequest, "Field 'jobId' is required"};
        }
        request.op = RequestOp::Cancel;
        request.job_id = **id;
        return request;
    }
    return Error{ErrorCode::InvalidRequest, "Unknown op: " + op};
}

int status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidRequest:
        case ErrorCode::InvalidBudget:       return 400;
        case ErrorCode::NotFound:            return 404;
        case ErrorCode::JobCancelled:        return 409;
        case ErrorCode::UnsupportedLanguage: return 422;
        case ErrorCode::CapacityExceeded:
        case ErrorCode::ShuttingDown:        return 503;
        case ErrorCode::Internal:
        case ErrorCode::SandboxSetup:
        case ErrorCode::Io:
        case ErrorCode::Config:              return 500;
    }
    return 500;
}

int status_for(TerminalState state) noexcept {
    switch (state) {
        case TerminalState::SandboxFailure: return 500;
        case TerminalState::Cancelled:      return 409;
        default:                            return 200;
    }
}

std::string encode_result(const ExecutionResult& result) {
    const int status = status_for(result.state);
    if (result.state == TerminalState::SandboxFailure) {
        // Nothing observed inside a failed sandbox is returned.
        ExecutionResult withheld;
        withheld.job_id = result.job_id;
        withheld.state = result.state;
        withheld.elapsed = result.elapsed;
        json body = {
            {"status", status},
            {"result", result_body(withheld)},
            {"error", {{"code", "sandbox_failure"}, {"message", kSandboxFailureMessage}}},
        };
        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json body = {{"status", status}, {"result", result_body(result)}};
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_error(const Error& error) {
    json body = {
        {"status", status_for(error.code)},
        {"error", {{"code", std::string{to_string(error.code)}}, {"message", error.message}}},
    };
    if (error.code == ErrorCode::CapacityExceeded || error.code == ErrorCode::ShuttingDown) {
        body["retryable"] = true;
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_cancel(const JobId& id, CancelOutcome outcome) {
    json body = {
        {"status", outcome == CancelOutcome::NotFound ? 404 : 200},
        {"cancel", {{"jobId", id}, {"outcome", std::string{to_string(outcome)}}}},
    };
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_health(const ServiceStats& stats) {
    json body = {
        {"status", 200},
        {"health", {
            {"status", "healthy"},
            {"service", "runbox"},
            {"uptimeMs", stats.uptime.count()},
            {"workers", stats.workers},
            {"busy", stats.busy},
            {"queued", stats.queued},
            {"completed", stats.completed},
            {"rejected", stats.rejected},
        }},
    };
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace runbox
