/*
 * Borsh C++ Benchmark Suite
 *
 * Measures the typed and schema-driven codecs on a representative
 * account-like record.
 */

#pragma once

#include <borsh/Borsh.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <numeric>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <atomic>
#include <latch>
#include <array>
#include <optional>
#include <stdexcept>

namespace borsh::benchmark {
    // ==================== Configuration ====================

    struct BenchConfig {
        static constexpr size_t DEFAULT_ITERATIONS = 200'000;
        static constexpr size_t WARMUP_COUNT = 10'000;
        static constexpr int WARMUP_ITERATIONS = 3;
        static constexpr size_t TAG_COUNT = 8;
        static constexpr size_t FILL_COUNT = 16;
    };

    // ==================== Latency Statistics ====================

    struct StatsReport {
        std::string name;
        size_t count;
        double ops_per_sec;
        double p50; // microseconds
        double p90;
        double p99;
        double p999;
        double max;

        std::string to_string() const {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);
            oss << "=== " << name << " ===" << std::endl;
            oss << "  Total ops:    " << std::setw(12) << count << std::endl;
            oss << "  ops/sec:      " << std::setw(12) << static_cast<size_t>(ops_per_sec) << std::endl;
            oss << "  p50:          " << std::setw(8) << p50 << " us" << std::endl;
            oss << "  p90:          " << std::setw(8) << p90 << " us" << std::endl;
            oss << "  p99:          " << std::setw(8) << p99 << " us" << std::endl;
            oss << "  p99.9:        " << std::setw(8) << p999 << " us" << std::endl;
            oss << "  max:          " << std::setw(8) << max << " us" << std::endl;
            return oss.str();
        }
    };

    class LatencyStats {
        public:
            explicit LatencyStats(std::string name, size_t expected) : name_{std::move(name)} { latencies_.reserve(expected); }

            void record(int64_t nanos) { latencies_.push_back(nanos); }

            [[nodiscard]] StatsReport report() const {
                if (latencies_.empty()) { return StatsReport{name_, 0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}; }

                auto sorted = latencies_;
                std::sort(sorted.begin(), sorted.end());

                const size_t count = sorted.size();
                const int64_t sum = std::accumulate(sorted.begin(), sorted.end(), int64_t{0});
                const double total_sec = static_cast<double>(sum) / 1'000'000'000.0;

                // Percentile helper (nanos -> micros)
                auto percentile = [&](double p) -> double {
                    const size_t idx = std::min(static_cast<size_t>((p / 100.0) * (count - 1)), count - 1);
                    return sorted[idx] / 1000.0;
                };

                return StatsReport{
                    .name = name_,
                    .count = count,
                    .ops_per_sec = total_sec > 0 ? count / total_sec : 0.0,
                    .p50 = percentile(50.0),
                    .p90 = percentile(90.0),
                    .p99 = percentile(99.0),
                    .p999 = percentile(99.9),
                    .max = sorted.back() / 1000.0
                };
            }

        private:
            std::string name_;
            std::vector<int64_t> latencies_;
    };

    /**
     * Times one call of fn in nanoseconds.
     */
    template <typename Fn>
    int64_t time_nanos(Fn&& fn) {
        const auto start = std::chrono::steady_clock::now();
        fn();
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }

    inline void print_separator(size_t length = 70) { std::cout << std::string(length, '=') << std::endl; }

    inline void print_dash(size_t length = 70) { std::cout << std::string(length, '-') << std::endl; }

    // ==================== Sample Data ====================

    struct Fill {
        uint32_t price = 0;
        uint64_t quantity = 0;

        BORSH_FIELDS(price, quantity)
    };

    struct Order {
        uint64_t id = 0;
        std::array<uint8_t, 32> owner{};
        std::vector<std::string> tags;
        std::optional<serialization::uint128> limit;
        std::vector<Fill> fills;

        BORSH_FIELDS(id, owner, tags, limit, fills)
    };

    inline layout::LayoutPtr order_layout() {
        using namespace layout;
        return structure({
            {"id", u64()},
            {"owner", array(u8(), 32)},
            {"tags", vec(string())},
            {"limit", option(u128())},
            {"fills", vec(structure({{"price", u32()}, {"quantity", u64()}}))},
        });
    }

    inline Order make_order(size_t index) {
        Order order;
        order.id = index;
        for (size_t i = 0; i < order.owner.size(); ++i) { order.owner[i] = static_cast<uint8_t>((index + i) % 256); }
        for (size_t i = 0; i < BenchConfig::TAG_COUNT; ++i) { order.tags.push_back("tag-" + std::to_string(i)); }
        order.limit = static_cast<serialization::uint128>(index) << 64;
        for (size_t i = 0; i < BenchConfig::FILL_COUNT; ++i) { order.fills.push_back(Fill{static_cast<uint32_t>(i), index * i}); }
        return order;
    }

    inline layout::Value to_value(const Order& order) {
        using layout::Value;

        layout::ValueList owner;
        for (const uint8_t byte : order.owner) { owner.emplace_back(byte); }

        layout::ValueList tags;
        for (const auto& tag : order.tags) { tags.emplace_back(tag); }

        layout::ValueList fills;
        for (const auto& fill : order.fills) {
            fills.push_back(Value::record({{"price", Value(fill.price)}, {"quantity", Value(fill.quantity)}}));
        }

        return Value::record({
            {"id", Value(order.id)},
            {"owner", Value(std::move(owner))},
            {"tags", Value(std::move(tags))},
            {"limit", order.limit ? Value::some(Value(*order.limit)) : Value::none()},
            {"fills", Value(std::move(fills))},
        });
    }

    // ==================== Benchmark Implementations ====================

    // 1. Encode - typed vs schema-driven
    class EncodeBenchmark {
        public:
            void run(size_t iterations) {
                std::cout << "\n";
                print_separator();
                std::cout << "Encode Benchmark - typed vs layout" << std::endl;
                print_separator();

                const auto order = make_order(42);
                const auto value = to_value(order);
                const layout::Codec codec(order_layout());

                std::cout << "Encoded size: " << serialization::encoded_size(order) << " bytes" << std::endl;

                LatencyStats typed("typed to_bytes", iterations);
                for (size_t i = 0; i < iterations; ++i) {
                    typed.record(time_nanos([&] { sink_ += serialization::to_bytes(order).size(); }));
                }

                LatencyStats dynamic("layout encode", iterations);
                for (size_t i = 0; i < iterations; ++i) {
                    dynamic.record(time_nanos([&] { sink_ += codec.encode(value).size(); }));
                }

                std::cout << typed.report().to_string() << dynamic.report().to_string();
            }

        private:
            size_t sink_ = 0;
    };

    // 2. Decode - typed vs schema-driven
    class DecodeBenchmark {
        public:
            void run(size_t iterations) {
                std::cout << "\n";
                print_separator();
                std::cout << "Decode Benchmark - typed vs layout" << std::endl;
                print_separator();

                const auto bytes = serialization::to_bytes(make_order(42));
                const layout::Codec codec(order_layout());

                LatencyStats typed("typed from_bytes", iterations);
                for (size_t i = 0; i < iterations; ++i) {
                    typed.record(time_nanos([&] { sink_ += serialization::from_bytes<Order>(bytes).fills.size(); }));
                }

                LatencyStats dynamic("layout decode", iterations);
                for (size_t i = 0; i < iterations; ++i) {
                    dynamic.record(time_nanos([&] { sink_ += codec.decode(bytes).is<layout::StructValue>() ? 1 : 0; }));
                }

                std::cout << typed.report().to_string() << dynamic.report().to_string();
            }

        private:
            size_t sink_ = 0;
    };

    // 3. Probe - size probe vs full decode
    class ProbeBenchmark {
        public:
            void run(size_t iterations) {
                std::cout << "\n";
                print_separator();
                std::cout << "Probe Benchmark - next_value_bytes over a stream" << std::endl;
                print_separator();

                constexpr size_t records = 64;
                std::vector<uint8_t> stream;
                for (size_t i = 0; i < records; ++i) { serialization::serialize(stream, make_order(i)); }

                const auto schema = order_layout();
                std::cout << "Stream: " << records << " records, " << stream.size() << " bytes" << std::endl;

                LatencyStats probe("probe stream", iterations / records);
                for (size_t i = 0; i < iterations / records; ++i) {
                    probe.record(time_nanos([&] {
                        std::span<const uint8_t> data(stream);
                        while (!data.empty()) { sink_ += layout::next_value_bytes(*schema, data).size(); }
                    }));
                }

                LatencyStats decode("decode stream", iterations / records);
                for (size_t i = 0; i < iterations / records; ++i) {
                    decode.record(time_nanos([&] {
                        std::span<const uint8_t> data(stream);
                        while (!data.empty()) { sink_ += layout::deserialize(*schema, data).is<layout::StructValue>() ? 1 : 0; }
                    }));
                }

                std::cout << probe.report().to_string() << decode.report().to_string();
            }

        private:
            size_t sink_ = 0;
    };

    // 4. Multi-threaded decode over one shared layout
    class MultiThreadBenchmark {
        public:
            void run(size_t ops_per_thread) {
                std::cout << "\n";
                print_separator();
                std::cout << "Multi-threaded Decode - shared layout" << std::endl;
                print_separator();

                const auto bytes = serialization::to_bytes(make_order(7));
                const layout::Codec codec(order_layout());

                const std::vector<int> thread_counts = {1, 2, 4, 8};
                for (const int threads : thread_counts) {
                    std::latch latch(threads);
                    std::atomic<size_t> total_ops{0};
                    std::atomic<size_t> failures{0};

                    const auto start_time = std::chrono::steady_clock::now();

                    std::vector<std::thread> workers;
                    for (int tid = 0; tid < threads; ++tid) {
                        workers.emplace_back([&, tid]() {
                            try {
                                for (size_t i = 0; i < ops_per_thread; ++i) {
                                    if (codec.decode(bytes).is<layout::StructValue>()) { total_ops.fetch_add(1, std::memory_order_relaxed); }
                                }
                            }
                            catch (const std::exception& e) {
                                failures.fetch_add(1, std::memory_order_relaxed);
                                std::cerr << "Thread " << tid << " error: " << e.what() << std::endl;
                            }
                            latch.count_down();
                        });
                    }

                    latch.wait();
                    const auto end_time = std::chrono::steady_clock::now();
                    for (auto& worker : workers) { if (worker.joinable()) { worker.join(); } }

                    const double elapsed_sec = std::chrono::duration<double>(end_time - start_time).count();
                    const double ops_per_sec = total_ops.load() / elapsed_sec;

                    std::cout << (failures.load() == 0 ? "+ " : "x ") << std::setw(2) << threads << " threads: "
                        << std::setw(12) << static_cast<size_t>(ops_per_sec) << " ops/sec" << std::endl;
                }
            }
    };

    // ==================== Suite ====================

    class BenchmarkSuite {
        public:
            static void print_header() {
                print_separator();
                std::cout << "Borsh C++ Benchmark Suite" << std::endl;
                print_separator();
            }

            static void run_encode(size_t iterations) { EncodeBenchmark{}.run(iterations); }
            static void run_decode(size_t iterations) { DecodeBenchmark{}.run(iterations); }
            static void run_probe(size_t iterations) { ProbeBenchmark{}.run(iterations); }
            static void run_mt(size_t iterations) { MultiThreadBenchmark{}.run(iterations); }

            static void run_all(size_t iterations) {
                run_encode(iterations);
                run_decode(iterations);
                run_probe(iterations);
                run_mt(iterations);
            }
    };
} // namespace borsh::benchmark
