/**
 * @file request_handler.hpp
 * @brief Dispatches decoded requests to the ExecutionService.
 */

#pragma once

#include "api/request_codec.hpp"
#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "service/execution_service.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace runbox {

/**
 * @brief Turns one request payload into one response payload.
 *
 * An execute request blocks the calling (connection) thread until the job's
 * result is delivered; admission itself never blocks.
 */
template <SandboxRunnerLike RunnerT>
class RequestHandler {
public:
    explicit RequestHandler(ExecutionService<RunnerT>& service, Logger* logger = nullptr)
        : service_(service), logger_(logger) {}

    [[nodiscard]] std::string handle(std::string_view payload) {
        try {
            return dispatch(payload);
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Request handling failed", {{"error", e.what()}});
            return encode_error(Error{ErrorCode::Internal, "Internal error"});
        }
    }

private:
    std::string dispatch(std::string_view payload) {
        auto request = parse_request(payload);
        if (!request) {
            if (logger_) {
                logger_->debug("Rejected request", {
                    {"code", std::string{to_string(request.error().code)}},
                    {"reason", request.error().message}
                });
            }
            return encode_error(request.error());
        }

        switch (request->op) {
            case RequestOp::Health:
                return encode_health(service_.stats());
            case RequestOp::Cancel:
                return encode_cancel(request->job_id, service_.cancel(request->job_id));
            case RequestOp::Execute:
                return execute(std::move(request->execute));
        }
        return encode_error(Error{ErrorCode::InvalidRequest, "Unknown op"});
    }

    std::string execute(SubmissionRequest submission_request) {
        auto submission = service_.submit(std::move(submission_request));
        if (!submission) return encode_error(submission.error());

        auto delivered = submission->result.get();
        if (!delivered) return encode_error(delivered.error());
        return encode_result(*delivered);
    }

    ExecutionService<RunnerT>& service_;
    Logger* logger_;
};

}  // namespace runbox
