/**
 * @file test_request_codec.cpp
 * @brief Unit tests for request parsing and response encoding.
 */

#include "api/request_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <csignal>

using namespace runbox;
using json = nlohmann::json;

// ═══════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════

TEST(RequestCodecTest, ParseExecuteFull) {
    auto request = parse_request(R"({
        "op": "execute",
        "language": "python",
        "source": "print(1)",
        "stdin": "abc",
        "submitter": "alice",
        "jobId": "my-job",
        "limitsOverride": {"cpuTimeMs": 500, "wallTimeMs": 1000,
                           "memoryBytes": 33554432, "maxOutputBytes": 10,
                           "maxProcesses": 2}
    })");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->op, RequestOp::Execute);

    const auto& exec = request->execute;
    EXPECT_EQ(exec.language, Language::Python);
    EXPECT_EQ(exec.source, "print(1)");
    EXPECT_EQ(exec.stdin_data, std::optional<std::string>{"abc"});
    EXPECT_EQ(exec.submitter, "alice");
    EXPECT_EQ(exec.job_id, std::optional<JobId>{"my-job"});
    EXPECT_EQ(exec.limits_override.cpu_time_ms, 500u);
    EXPECT_EQ(exec.limits_override.wall_time_ms, 1000u);
    EXPECT_EQ(exec.limits_override.memory_bytes, 33554432u);
    EXPECT_EQ(exec.limits_override.max_output_bytes, 10u);
    EXPECT_EQ(exec.limits_override.max_processes, 2u);
}

TEST(RequestCodecTest, OpDefaultsToExecute) {
    auto request = parse_request(R"({"language":"sh","source":"echo hi"})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->op, RequestOp::Execute);
    EXPECT_EQ(request->execute.language, Language::Shell);
    EXPECT_FALSE(request->execute.stdin_data.has_value());
    EXPECT_FALSE(request->execute.job_id.has_value());
    EXPECT_TRUE(request->execute.limits_override.empty());
}

TEST(RequestCodecTest, ParseCancelAndHealth) {
    auto cancel = parse_request(R"({"op":"cancel","jobId":"job-9"})");
    ASSERT_TRUE(cancel.has_value());
    EXPECT_EQ(cancel->op, RequestOp::Cancel);
    EXPECT_EQ(cancel->job_id, "job-9");

    auto health = parse_request(R"({"op":"health"})");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->op, RequestOp::Health);
}

TEST(RequestCodecTest, MalformedRejected) {
    for (const char* payload : {"not json", "[1,2,3]", "{\"op\":42}",
                                "{\"op\":\"reboot\"}", "{\"op\":\"cancel\"}",
                                "{\"language\":\"python\"}",
                                "{\"language\":7,\"source\":\"x\"}",
                                "{\"language\":\"python\",\"source\":\"x\",\"stdin\":5}",
                                "{\"language\":\"python\",\"source\":\"x\",\"limitsOverride\":[]}",
                                "{\"language\":\"python\",\"source\":\"x\",\"jobId\":\"\"}"}) {
        auto request = parse_request(payload);
        ASSERT_FALSE(request.has_value()) << payload;
        EXPECT_EQ(request.error().code, ErrorCode::InvalidRequest) << payload;
    }
}

TEST(RequestCodecTest, UnknownLanguage) {
    auto request = parse_request(R"({"language":"brainfuck","source":"+"})");
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().code, ErrorCode::UnsupportedLanguage);
}

TEST(RequestCodecTest, NegativeLimitIsInvalidBudget) {
    auto request = parse_request(
        R"({"language":"python","source":"x","limitsOverride":{"wallTimeMs":-5}})");
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().code, ErrorCode::InvalidBudget);
}

TEST(RequestCodecTest, FractionalLimitIsMalformed) {
    auto request = parse_request(
        R"({"language":"python","source":"x","limitsOverride":{"wallTimeMs":1.5}})");
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().code, ErrorCode::InvalidRequest);
}

// ═══════════════════════════════════════════════
// Status mapping
// ═══════════════════════════════════════════════

TEST(RequestCodecTest, StatusForErrors) {
    EXPECT_EQ(status_for(ErrorCode::InvalidRequest), 400);
    EXPECT_EQ(status_for(ErrorCode::InvalidBudget), 400);
    EXPECT_EQ(status_for(ErrorCode::NotFound), 404);
    EXPECT_EQ(status_for(ErrorCode::JobCancelled), 409);
    EXPECT_EQ(status_for(ErrorCode::UnsupportedLanguage), 422);
    EXPECT_EQ(status_for(ErrorCode::CapacityExceeded), 503);
    EXPECT_EQ(status_for(ErrorCode::ShuttingDown), 503);
    EXPECT_EQ(status_for(ErrorCode::Internal), 500);
}

TEST(RequestCodecTest, StatusForStates) {
    // A program's own failure is still a successful service call.
    EXPECT_EQ(status_for(TerminalState::Completed), 200);
    EXPECT_EQ(status_for(TerminalState::RuntimeError), 200);
    EXPECT_EQ(status_for(TerminalState::TimedOut), 200);
    EXPECT_EQ(status_for(TerminalState::MemoryExceeded), 200);
    EXPECT_EQ(status_for(TerminalState::OutputExceeded), 200);
    EXPECT_EQ(status_for(TerminalState::Cancelled), 409);
    EXPECT_EQ(status_for(TerminalState::SandboxFailure), 500);
}

// ═══════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════

TEST(RequestCodecTest, EncodeCompletedResult) {
    ExecutionResult result;
    result.job_id = "job-1";
    result.state = TerminalState::Completed;
    result.stdout_text = "hi\n";
    result.exit_code = 0;
    result.elapsed = Millis{15};
    result.cpu_time = Millis{3};
    result.peak_memory_bytes = 4096;

    auto body = json::parse(encode_result(result));
    EXPECT_EQ(body["status"], 200);
    const auto& r = body["result"];
    EXPECT_EQ(r["jobId"], "job-1");
    EXPECT_EQ(r["state"], "Completed");
    EXPECT_EQ(r["stdout"], "hi\n");
    EXPECT_EQ(r["stderr"], "");
    EXPECT_EQ(r["stdoutTruncated"], false);
    EXPECT_EQ(r["exitCode"], 0);
    EXPECT_FALSE(r.contains("signal"));
    EXPECT_EQ(r["elapsedMs"], 15);
    EXPECT_EQ(r["cpuTimeMs"], 3);
    EXPECT_EQ(r["peakMemoryBytes"], 4096);
    EXPECT_FALSE(body.contains("error"));
}

TEST(RequestCodecTest, EncodeSignalledResultHasNullExitCode) {
    ExecutionResult result;
    result.job_id = "job-2";
    result.state = TerminalState::TimedOut;
    result.signal = SIGKILL;

    auto body = json::parse(encode_result(result));
    EXPECT_EQ(body["status"], 200);
    EXPECT_TRUE(body["result"]["exitCode"].is_null());
    EXPECT_EQ(body["result"]["signal"], SIGKILL);
    EXPECT_EQ(body["result"]["state"], "TimedOut");
}

TEST(RequestCodecTest, EncodeSandboxFailureWithholdsDetails) {
    ExecutionResult result;
    result.job_id = "job-3";
    result.state = TerminalState::SandboxFailure;
    result.stdout_text = "leaked";
    result.exit_code = 0;

    auto body = json::parse(encode_result(result));
    EXPECT_EQ(body["status"], 500);
    EXPECT_EQ(body["result"]["state"], "SandboxFailure");
    EXPECT_EQ(body["result"]["stdout"], "");
    EXPECT_TRUE(body["result"]["exitCode"].is_null());
    EXPECT_EQ(body["error"]["code"], "sandbox_failure");
}

TEST(RequestCodecTest, EncodeCapacityErrorIsRetryable) {
    auto body = json::parse(encode_error(Error{ErrorCode::CapacityExceeded, "full"}));
    EXPECT_EQ(body["status"], 503);
    EXPECT_EQ(body["error"]["code"], "capacity_exceeded");
    EXPECT_EQ(body["retryable"], true);

    auto invalid = json::parse(encode_error(Error{ErrorCode::InvalidBudget, "low"}));
    EXPECT_EQ(invalid["status"], 400);
    EXPECT_FALSE(invalid.contains("retryable"));
}

TEST(RequestCodecTest, EncodeCancel) {
    auto removed = json::parse(encode_cancel("job-4", CancelOutcome::RemovedFromQueue));
    EXPECT_EQ(removed["status"], 200);
    EXPECT_EQ(removed["cancel"]["outcome"], "removed_from_queue");

    auto missing = json::parse(encode_cancel("job-5", CancelOutcome::NotFound));
    EXPECT_EQ(missing["status"], 404);
    EXPECT_EQ(missing["cancel"]["jobId"], "job-5");
}

TEST(RequestCodecTest, EncodeHealth) {
    ServiceStats stats;
    stats.workers = 4;
    stats.busy = 1;
    stats.queued = 2;
    stats.completed = 10;

    auto body = json::parse(encode_health(stats));
    EXPECT_EQ(body["status"], 200);
    EXPECT_EQ(body["health"]["status"], "healthy");
    EXPECT_EQ(body["health"]["workers"], 4);
    EXPECT_EQ(body["health"]["queued"], 2);
    EXPECT_EQ(body["health"]["completed"], 10);
}

TEST(RequestCodecTest, EncodedOutputIsValidJsonForAnyBytes) {
    ExecutionResult result;
    result.job_id = "job-6";
    result.state = TerminalState::Completed;
    result.stdout_text = std::string{"bad \xff byte"};

    auto encoded = encode_result(result);
    EXPECT_NO_THROW((void)json::parse(encoded));
}
