/**
 * @file bench_schedule.cpp
 * @brief Performance benchmarks for pattern matching and reservation queries.
 * @author Dimitris Kafetzis
 *
 * Measures parse cost, floor/ceil search cost (including sparse patterns
 * that force long scans) and the per-poll cost a host pays per node.
 *
 * Usage: ./bench_schedule [--csv]
 */

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/time_format.hpp"
#include "core/types.hpp"
#include "cron/cron_pattern.hpp"
#include "host/reservation_host.hpp"
#include "host/timeline.hpp"
#include "reservation/node.hpp"
#include "reservation/policy.hpp"
#include "reservation/schedule.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace slot_reserver;
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

const EpochMillis kBase = make_timestamp(2024, 5, 15, 10, 17);

CronPattern pattern(const std::string& text) {
    return *CronPattern::parse(text);
}

std::string rule_text(size_t n) {
    std::string text;
    for (size_t i = 0; i < n; ++i) {
        text += std::to_string(i % 3 + 1) + ":" + std::to_string(i % 60) + " "
              + std::to_string(i % 24) + " * * " + (i % 2 ? "1-5" : "*") + ":"
              + std::to_string(30 + i % 90) + "\n";
    }
    return text;
}

/// Per-poll cost through the compile-time interface.
template <ReservationPolicyLike Policy>
BenchResult bench_poll(const std::string& name, const Policy& policy, const INode& node,
                       const std::string& extra) {
    EpochMillis t = kBase;
    return run_bench(name, "Policy Poll", 1000, [&] {
        auto size = policy.size_of_reservation(node, t);
        auto next = policy.time_of_next_change(node, t);
        (void)size;
        t = next && *next > t ? *next : t + kMillisPerMinute;
    }, extra);
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_parse() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    for (const char* text : {"* * * * *", "0 9 * * 1-5", "*/15 9-17 * * 1-5",
                             "0,10,20,30,40,50 H(0-6) 1-31/2 * 0-7", "@midnight"}) {
        R.push_back(run_bench(std::string{"pattern("} + text + ")", "Parse", N,
            [&]{ auto p = CronPattern::parse(text); (void)p; }));
    }

    for (size_t n : {1, 10, 100}) {
        auto text = rule_text(n);
        R.push_back(run_bench("schedule(" + std::to_string(n) + ")", "Parse", N / 10,
            [&]{ auto s = ReservationSchedule::parse(text); (void)s; },
            std::to_string(n) + " rules"));
    }
    return R;
}

std::vector<BenchResult> bench_search() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    struct Case { const char* text; const char* info; };
    for (auto [text, info] : {Case{"* * * * *", "every minute"},
                              Case{"0 9 * * 1-5", "weekday"},
                              Case{"0 0 1 1 *", "yearly"},
                              Case{"0 0 29 2 *", "leap day"},
                              Case{"0 0 13 * 5", "Friday 13th"}}) {
        auto p = pattern(text);
        R.push_back(run_bench(std::string{"floor("} + text + ")", "Search", N,
            [&]{ auto r = p.floor(kBase); (void)r; }, info));
        R.push_back(run_bench(std::string{"ceil("} + text + ")", "Search", N,
            [&]{ auto r = p.ceil(kBase); (void)r; }, info));
    }

    auto never = pattern("0 0 31 2 *");
    R.push_back(run_bench("ceil(0 0 31 2 *)", "Search", 20,
        [&]{ auto r = never.ceil(kBase); (void)r; }, "horizon exhausted"));
    return R;
}

std::vector<BenchResult> bench_policy() {
    std::vector<BenchResult> R;
    StaticNode node(16);

    for (size_t n : {1, 10, 100}) {
        auto policy = CronReservationPolicy::from_format(rule_text(n));
        if (!policy) continue;
        R.push_back(bench_poll("cron_poll(" + std::to_string(n) + ")", *policy, node,
                               std::to_string(n) + " rules"));
    }

    auto weekday = CronReservationPolicy::from_format("2:0 9 * * 1-5:480\n*:@midnight:60\n");
    if (weekday) {
        R.push_back(run_bench("timeline(1 week)", "Policy Poll", 50,
            [&]{
                auto tl = build_timeline(*weekday, node, kBase,
                                         kBase + 7 * 24 * 60 * kMillisPerMinute);
                (void)tl;
            }, "2 rules"));
    }
    return R;
}

std::vector<BenchResult> bench_host() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    Logger logger(std::make_unique<NullSink>());
    MetricsCollector metrics(std::make_unique<NullSink>());
    ReservationHost host(logger, metrics);
    StaticNode node(8);

    for (int i = 0; i < 50; ++i) {
        auto loaded = host.load_cron_schedule("node-" + std::to_string(i), rule_text(10));
        (void)loaded;
    }

    R.push_back(run_bench("evaluate(1 node)", "Host", N,
        [&]{ auto r = host.evaluate("node-0", node, kBase); (void)r; }, "10 rules"));
    R.push_back(run_bench("evaluate(50 nodes)", "Host", N / 10,
        [&]{
            for (int i = 0; i < 50; ++i) {
                auto r = host.evaluate("node-" + std::to_string(i), node, kBase);
                (void)r;
            }
        }, "10 rules each"));
    R.push_back(run_bench("reload(10 rules)", "Host", N / 10,
        [&]{ auto r = host.load_cron_schedule("node-0", rule_text(10)); (void)r; }));
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  slot_reserver Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_parse());
    append(bench_search());
    append(bench_policy());
    append(bench_host());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
