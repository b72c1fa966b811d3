/**
 * @file bench_admission.cpp
 * @brief Performance benchmarks for admission, queueing and the wire codec.
 *
 * Measures the service overhead around a sandbox: submit/admission latency
 * with an instant runner, queue operations, request parsing and response
 * encoding, and framed TCP round trips.
 *
 * Usage: ./bench_admission [--csv]
 */

#include "api/request_codec.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "limits/budget_policy.hpp"
#include "network/transport.hpp"
#include "service/execution_queue.hpp"
#include "service/execution_service.hpp"
#include "verdict/utf8.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

using namespace runbox;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Completes every job immediately; isolates the service's own overhead.
struct InstantRunner {
    ExecutionResult run(const ExecutionJob& job, const ResourceBudget&, std::stop_token) {
        ExecutionResult result;
        result.job_id = job.id;
        result.state = TerminalState::Completed;
        result.exit_code = 0;
        result.stdout_text = "ok\n";
        return result;
    }
};

SubmissionRequest make_request() {
    SubmissionRequest request;
    request.language = Language::Shell;
    request.source = "echo ok";
    request.submitter = "bench";
    return request;
}

QueueSlot make_slot(const std::string& id) {
    auto job = std::make_shared<ExecutionJob>();
    job->id = id;
    QueueSlot slot;
    slot.job = std::move(job);
    slot.arrived_at = std::chrono::steady_clock::now();
    return slot;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_admission() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    for (uint32_t workers : {1u, 4u, 8u}) {
        auto config = default_config();
        config.service.workers = workers;
        config.service.queue_capacity = 1024;
        InstantRunner runner;
        ExecutionService<InstantRunner> service(config, runner);

        R.push_back(run_bench("submit_and_wait(" + std::to_string(workers) + "w)", "Admission", N,
            [&]{
                auto s = service.submit(make_request());
                if (s) { auto r = s->result.get(); (void)r; }
            }, std::to_string(workers) + " workers"));

        R.push_back(run_bench("submit_burst16(" + std::to_string(workers) + "w)", "Admission", N / 10,
            [&]{
                std::vector<std::future<Result<ExecutionResult>>> pending;
                pending.reserve(16);
                for (int i = 0; i < 16; ++i) {
                    auto s = service.submit(make_request());
                    if (s) pending.push_back(std::move(s->result));
                }
                for (auto& f : pending) { auto r = f.get(); (void)r; }
            }, "16 jobs"));

        R.push_back(run_bench("stats(" + std::to_string(workers) + "w)", "Admission", N,
            [&]{ auto s = service.stats(); (void)s; }));
        service.shutdown();
    }

    BudgetPolicy policy(default_config().limits);
    PartialBudget partial;
    partial.wall_time_ms = 1000;
    partial.memory_bytes = 1ULL << 40;
    R.push_back(run_bench("budget_resolve", "Admission", N,
        [&]{ auto b = policy.resolve(partial); (void)b; }, "clamp + keep"));

    return R;
}

std::vector<BenchResult> bench_queue() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t depth : {16, 256, 1024}) {
        R.push_back(run_bench("push_pop(" + std::to_string(depth) + ")", "Queue", N,
            [&]{
                ExecutionQueue q(depth);
                for (size_t i = 0; i < depth; ++i) (void)q.push(make_slot("job-" + std::to_string(i)));
                while (auto s = q.pop()) (void)s;
            }, std::to_string(depth) + " slots"));

        R.push_back(run_bench("cancel_middle(" + std::to_string(depth) + ")", "Queue", N,
            [&]{
                ExecutionQueue q(depth);
                for (size_t i = 0; i < depth; ++i) (void)q.push(make_slot("job-" + std::to_string(i)));
                auto removed = q.remove("job-" + std::to_string(depth / 2));
                (void)removed;
            }, std::to_string(depth) + " slots"));
    }

    return R;
}

std::vector<BenchResult> bench_codec() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    const std::string small_request =
        R"json({"op":"execute","language":"python","source":"print(1)","limitsOverride":{"wallTimeMs":1000}})json";
    std::string large_request = R"({"language":"python","source":")";
    large_request += std::string(64 * 1024, 'x');
    large_request += R"("})";

    R.push_back(run_bench("parse_small", "Codec", N,
        [&]{ auto r = parse_request(small_request); (void)r; }, std::to_string(small_request.size()) + " B"));
    R.push_back(run_bench("parse_64KB_source", "Codec", N / 4,
        [&]{ auto r = parse_request(large_request); (void)r; }, "64 KB"));

    ExecutionResult result;
    result.job_id = "job-1";
    result.state = TerminalState::Completed;
    result.exit_code = 0;
    result.stdout_text = std::string(64 * 1024, 'y');
    R.push_back(run_bench("encode_64KB_result", "Codec", N / 4,
        [&]{ auto s = encode_result(result); (void)s; }, "64 KB stdout"));

    std::string noisy(64 * 1024, 'z');
    for (size_t i = 0; i < noisy.size(); i += 97) noisy[i] = static_cast<char>(0xff);
    R.push_back(run_bench("utf8_sanitize_64KB", "Codec", N / 4,
        [&]{ auto s = decode_utf8_lossy(noisy); (void)s; }, "1% invalid"));

    return R;
}

std::vector<BenchResult> bench_transport() {
    std::vector<BenchResult> R;
    TcpTransport server(4);
    if (!server.listen(0).has_value()) return R;
    server.serve([](const std::vector<uint8_t>& r){ return r; });
    const uint16_t port = server.bound_port();

    std::vector<uint8_t> small(64), large(64 * 1024);
    // One request per connection, as the server expects.
    auto roundtrip = [port](const std::vector<uint8_t>& payload) {
        TcpTransport client;
        if (!client.connect("127.0.0.1", port, 2000)) return;
        if (!client.send(payload)) return;
        auto r = client.receive(5000);
        (void)r;
    };

    R.push_back(run_bench("tcp_request_64B", "Transport", 200,
        [&]{ roundtrip(small); }, "64 B"));
    R.push_back(run_bench("tcp_request_64KB", "Transport", 100,
        [&]{ roundtrip(large); }, "64 KB"));

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Transport", 500, [&]{
        std::promise<void> p; auto f = p.get_future();
        if (tpool.try_submit([&p](std::stop_token) { p.set_value(); })) f.wait();
    }));

    server.stop_serving();
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  runbox Service Overhead Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_admission());
    append(bench_queue());
    append(bench_codec());
    append(bench_transport());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
