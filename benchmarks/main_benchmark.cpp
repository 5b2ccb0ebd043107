/*
 * Borsh C++ Benchmark Suite - Main Program
 *
 * Build:
 *   cmake -S . -B build -DBORSH_BUILD_BENCHMARKS=ON -DCMAKE_BUILD_TYPE=Release
 *
 * Run:
 *   ./borsh_benchmark --benchmark all
 *   ./borsh_benchmark --benchmark encode
 *   ./borsh_benchmark --benchmark decode
 *   ./borsh_benchmark --benchmark probe
 *   ./borsh_benchmark --benchmark mt --iterations 50000
 */

#include "borsh_benchmark.hpp"
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>

using namespace borsh::benchmark;

void print_current_time() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::cout << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << std::endl;
}

int main(int argc, char** argv) {
    BenchmarkSuite::print_header();

    std::string benchmark_type = "all";
    size_t iterations = BenchConfig::DEFAULT_ITERATIONS;

    // Parse command line arguments
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--benchmark") == 0) { benchmark_type = argv[++i]; }
        else if (std::strcmp(argv[i], "--iterations") == 0) {
            const long long parsed = std::atoll(argv[++i]);
            if (parsed <= 0) {
                std::cerr << "--iterations must be a positive integer" << std::endl;
                return 1;
            }
            iterations = static_cast<size_t>(parsed);
        }
    }

    std::cout << "\nRunning benchmark: " << benchmark_type << " (" << iterations << " iterations)" << std::endl;
    std::cout << "Start time: ";
    print_current_time();
    std::cout << std::endl;

    try {
        // Warmup
        std::cout << "Warming up..." << std::endl;
        for (int i = 0; i < BenchConfig::WARMUP_ITERATIONS; ++i) {
            for (size_t j = 0; j < BenchConfig::WARMUP_COUNT; ++j) {
                const auto bytes = borsh::serialization::to_bytes(make_order(j));
                if (borsh::serialization::from_bytes<Order>(bytes).id != j) { throw std::runtime_error("warmup round trip mismatch"); }
            }
        }
        std::cout << std::endl;

        if (benchmark_type == "all") { BenchmarkSuite::run_all(iterations); }
        else if (benchmark_type == "encode") { BenchmarkSuite::run_encode(iterations); }
        else if (benchmark_type == "decode") { BenchmarkSuite::run_decode(iterations); }
        else if (benchmark_type == "probe") { BenchmarkSuite::run_probe(iterations); }
        else if (benchmark_type == "mt") { BenchmarkSuite::run_mt(iterations); }
        else {
            std::cerr << "Unknown benchmark type: " << benchmark_type << std::endl;
            std::cerr << "Available: all, encode, decode, probe, mt" << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "\nBenchmark failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nBenchmark completed successfully!" << std::endl;
    std::cout << "End time: ";
    print_current_time();
    std::cout << std::endl;

    return 0;
}
