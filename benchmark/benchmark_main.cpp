// ============================================================================
// BEACON AGENT CORE - HOT PATH BENCHMARK
// ============================================================================
// Measures the per-call cost the agent adds to the host's thread:
//
// Scenarios:
//   - TAG_ENCODE:     TagEncoder::encode of a small tag set
//   - GAUGE:          MetricApi::setGauge, 1 thread
//   - GAUGE_MT:       MetricApi::setGauge, N threads sharing one agent
//   - SEND_ERROR:     SubmissionPipeline::sendError of a native exception
//   - CONFIG_READ:    ConfigLifecycle::config() while another thread publishes
// ============================================================================

#include <beacon/core/config/config_cell.hpp>
#include <beacon/core/encoding/tag_encoder.hpp>
#include <beacon/core/lifecycle/config_lifecycle.hpp>
#include <beacon/core/metrics/metric_api.hpp>
#include <beacon/core/submission/submission_pipeline.hpp>
#include <beacon/core/version.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std;
using namespace std::chrono;
using namespace Beacon;

// ============================================================================
// MONOTONIC CLOCK (steady_clock)
// ============================================================================

class Clock {
public:
    static inline uint64_t now_ns() {
        return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
    }
};

// ============================================================================
// COUNTING BACKEND
// ============================================================================

// Accepts everything and only counts, so timings show agent overhead alone
class CountingBackend : public IBackend {
public:
    void start() override { loaded_ = true; }
    void stop() override { loaded_ = false; }
    bool loaded() const override { return loaded_.load(); }

    bool setGauge(const string&, double, const EncodedTags&) override { return count(); }
    bool incrementCounter(const string&, double, const EncodedTags&) override { return count(); }
    bool addDistributionValue(const string&, double, const EncodedTags&) override { return count(); }
    bool submitError(const ErrorSubmission&) override { return count(); }

    const char* name() const override { return "counting"; }

    uint64_t calls() const { return calls_.load(); }

private:
    bool count() {
        calls_.fetch_add(1, memory_order_relaxed);
        return true;
    }

    atomic<bool> loaded_{false};
    atomic<uint64_t> calls_{0};
};

AgentConfig benchmarkConfig() {
    AgentConfig config;
    config.active = true;
    config.push_api_key = "benchmark";
    config.hostname = "bench-host";
    config.log_level = "error";
    config.probes.enabled = false;
    return config;
}

// ============================================================================
// RESULT STRUCT
// ============================================================================

struct BenchmarkResult {
    string name;
    uint64_t operations = 0;
    int threads = 1;
    double duration_sec = 0;
    vector<uint64_t> samples_ns;   // Per-call latency, sampled

    string to_string() const {
        vector<uint64_t> sorted = samples_ns;
        sort(sorted.begin(), sorted.end());
        auto pct = [&](size_t p) -> double {
            return sorted.empty() ? 0.0 : (double)sorted[min(sorted.size() - 1, sorted.size() * p / 100)];
        };

        ostringstream oss;
        oss << fixed << setprecision(2);
        oss << "\n[Scenario: " << name << "]\n";
        oss << "Threads: " << threads << "\n";
        oss << "Operations: " << operations << "\n";
        oss << "Duration: " << duration_sec << " sec\n";
        oss << "Throughput: " << (operations / duration_sec / 1e6) << "M ops/sec\n";
        oss << "Latency (ns): p50=" << setprecision(0) << pct(50)
            << " p95=" << pct(95) << " p99=" << pct(99) << "\n";
        return oss.str();
    }
};

// Time `operations` calls of fn, sampling every 64th call
template <typename Fn>
BenchmarkResult runSingle(const string& name, uint64_t operations, Fn&& fn) {
    BenchmarkResult result;
    result.name = name;
    result.operations = operations;
    result.samples_ns.reserve(operations / 64 + 1);

    const uint64_t start = Clock::now_ns();
    for (uint64_t i = 0; i < operations; ++i) {
        if ((i & 63) == 0) {
            const uint64_t t0 = Clock::now_ns();
            fn(i);
            result.samples_ns.push_back(Clock::now_ns() - t0);
        } else {
            fn(i);
        }
    }
    result.duration_sec = (Clock::now_ns() - start) / 1e9;
    return result;
}

// ============================================================================
// SCENARIOS
// ============================================================================

BenchmarkResult benchTagEncode(uint64_t operations) {
    TagSet tags = {{"env", "prod"}, {"region", "eu-west-1"}, {"shard", 7}, {"ratio", 0.25}};
    size_t bytes = 0;
    auto result = runSingle("TAG_ENCODE", operations, [&](uint64_t) {
        bytes += TagEncoder::encode(tags).size();
    });
    if (bytes == 0) cerr << "unexpected empty encoding\n";
    return result;
}

BenchmarkResult benchGauge(MetricApi& metrics, uint64_t operations) {
    TagSet tags = {{"env", "prod"}};
    return runSingle("GAUGE", operations, [&](uint64_t i) {
        metrics.setGauge("queue_depth", i, tags);
    });
}

BenchmarkResult benchGaugeConcurrent(MetricApi& metrics, uint64_t operations, int num_threads) {
    BenchmarkResult result;
    result.name = "GAUGE_MT";
    result.threads = num_threads;
    result.operations = operations;

    vector<vector<uint64_t>> per_thread(num_threads);
    vector<thread> workers;
    const uint64_t per_worker = operations / num_threads;

    const uint64_t start = Clock::now_ns();
    for (int t = 0; t < num_threads; ++t) {
        workers.emplace_back([&, t]() {
            TagSet tags = {{"worker", t}};
            for (uint64_t i = 0; i < per_worker; ++i) {
                if ((i & 63) == 0) {
                    const uint64_t t0 = Clock::now_ns();
                    metrics.setGauge("worker_progress", i, tags);
                    per_thread[t].push_back(Clock::now_ns() - t0);
                } else {
                    metrics.setGauge("worker_progress", i, tags);
                }
            }
        });
    }
    for (auto& worker : workers) worker.join();
    result.duration_sec = (Clock::now_ns() - start) / 1e9;

    for (auto& samples : per_thread) {
        result.samples_ns.insert(result.samples_ns.end(), samples.begin(), samples.end());
    }
    return result;
}

BenchmarkResult benchSendError(SubmissionPipeline& pipeline, uint64_t operations) {
    SendErrorOptions options;
    options.stack = Stacktrace{
        {"Checkout.submit", SourceLocation{"src/checkout.cpp", 120}, nullopt},
        {"Router.dispatch", SourceLocation{"src/router.cpp", 48}, nullopt},
    };
    options.tags = {{"route", "/checkout"}};
    const auto error = make_exception_ptr(runtime_error("payment gateway timeout"));

    return runSingle("SEND_ERROR", operations, [&](uint64_t) {
        pipeline.sendError(error, options);
    });
}

BenchmarkResult benchConfigRead(ConfigLifecycle& lifecycle, uint64_t operations) {
    atomic<bool> done{false};
    ConfigCell writer_cell;
    thread writer([&]() {
        while (!done.load(memory_order_acquire)) {
            writer_cell.publish(benchmarkConfig());
            this_thread::sleep_for(microseconds(50));
        }
    });

    size_t seen = 0;
    auto result = runSingle("CONFIG_READ", operations, [&](uint64_t) {
        seen += lifecycle.config()->config.push_api_key.size();
        seen += writer_cell.snapshot()->version > 0 ? 1 : 0;
    });

    done.store(true, memory_order_release);
    writer.join();
    if (seen == 0) cerr << "no snapshots observed\n";
    return result;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    spdlog::set_level(spdlog::level::err);

    cout << "\n";
    cout << "========================================================================\n";
    cout << "  BEACON AGENT CORE " << BEACON_VERSION << " - HOT PATH BENCHMARK\n";
    cout << "========================================================================\n";

    const uint64_t OPERATIONS = 1'000'000;
    const int THREADS = max(2u, thread::hardware_concurrency());

    CountingBackend backend;
    ConfigLifecycle lifecycle(backend, [] { return benchmarkConfig(); });
    if (lifecycle.initialize() != LifecycleState::ENABLED_ACTIVE) {
        cerr << "Agent did not become active, aborting benchmark\n";
        return 1;
    }
    MetricApi metrics(backend, lifecycle);
    DefaultTransactionFactory factory;
    SubmissionPipeline pipeline(backend, lifecycle, factory);

    cout << "\nConfiguration:\n";
    cout << "  Operations per scenario: " << OPERATIONS << "\n";
    cout << "  Hardware concurrency: " << thread::hardware_concurrency() << "\n";
    cout << "\nRunning benchmarks...\n";

    vector<BenchmarkResult> results;
    results.push_back(benchTagEncode(OPERATIONS));
    results.push_back(benchGauge(metrics, OPERATIONS));
    results.push_back(benchGaugeConcurrent(metrics, OPERATIONS, THREADS));
    results.push_back(benchSendError(pipeline, OPERATIONS / 10));
    results.push_back(benchConfigRead(lifecycle, OPERATIONS));

    for (const auto& result : results) {
        cout << result.to_string();
    }

    cout << "\nBackend calls: " << backend.calls() << "\n";
    lifecycle.stop();

    cout << "\n========================================================================\n";
    cout << "  BENCHMARK COMPLETED\n";
    cout << "========================================================================\n\n";
    return 0;
}
