/**
 * deepclone Benchmark Harness
 *
 * Times a callable over a fixed number of iterations after a warmup pass and
 * reports per-operation cost, either as a text table or as JSON so runs with
 * different cache settings can be diffed.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace bench {

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::nanoseconds;

struct BenchResult {
    std::string name;
    std::string group;
    int64_t iterations;
    int64_t total_ns;
    int64_t per_op_ns;
    int64_t ops_per_sec;
    std::string notes;
};

class Benchmark {
public:
    explicit Benchmark(std::string group) : group_(std::move(group)) {}

    // Warm up, then time `iterations` calls of `func`
    template <typename Func>
    const BenchResult& run(const std::string& name, int64_t iterations, Func&& func,
                           int warmup = 100, const std::string& notes = "") {
        for (int i = 0; i < warmup; ++i) {
            func();
        }

        auto start = Clock::now();
        for (int64_t i = 0; i < iterations; ++i) {
            func();
        }
        auto end = Clock::now();

        const int64_t total_ns = std::chrono::duration_cast<Duration>(end - start).count();
        const int64_t per_op_ns = iterations > 0 ? total_ns / iterations : 0;
        const int64_t ops_per_sec =
            iterations > 0 && total_ns > 0 ? (iterations * 1000000000LL) / total_ns : 0;

        results_.push_back({name, group_, iterations, total_ns, per_op_ns, ops_per_sec, notes});
        return results_.back();
    }

    void print_results() const {
        size_t width = 0;
        for (const auto& r : results_) {
            width = std::max(width, r.name.size());
        }

        std::cout << "\n" << group_ << "\n" << std::string(group_.size(), '=') << "\n\n";
        for (const auto& r : results_) {
            std::cout << "  " << r.name << std::string(width - r.name.size() + 2, ' ')
                      << r.per_op_ns << " ns/op  (" << r.ops_per_sec << " ops/s, "
                      << r.iterations << " iterations)";
            if (!r.notes.empty()) {
                std::cout << "  " << r.notes;
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    void output_json(std::ostream& out) const {
        out << "{\n";
        out << "  \"group\": \"" << group_ << "\",\n";
        out << "  \"results\": [\n";
        for (size_t i = 0; i < results_.size(); ++i) {
            const auto& r = results_[i];
            out << "    {\"name\": \"" << r.name << "\", \"iterations\": " << r.iterations
                << ", \"total_ns\": " << r.total_ns << ", \"per_op_ns\": " << r.per_op_ns
                << ", \"ops_per_sec\": " << r.ops_per_sec << "}";
            if (i + 1 < results_.size())
                out << ",";
            out << "\n";
        }
        out << "  ]\n";
        out << "}\n";
    }

    bool save_json(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        output_json(file);
        return true;
    }

    const std::vector<BenchResult>& results() const {
        return results_;
    }

private:
    std::string group_;
    std::vector<BenchResult> results_;
};

// Keeps `value` alive past the optimizer
template <typename T> inline void do_not_optimize(T&& value) {
    asm volatile("" : : "g"(value) : "memory");
}

} // namespace bench
