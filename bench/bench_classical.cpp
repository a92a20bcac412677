#include <chrono>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <iomanip>

#include "cipher/cipher.hpp"
#include "cipher/Caesar/caesar.hpp"
#include "cipher/Bellaso/bellaso.hpp"
#include "core/Alphabet.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string algo;
    size_t size;
    double mbps;
    double usec_per_op;
};

// Text drawn from the alphabet window so the bounds gate always passes
static std::string makePlaintext(size_t size) {
    std::string text(size, ' ');
    for (size_t i = 0; i < size; ++i)
        text[i] = Alphabet::wrap(static_cast<long long>(Alphabet::LOWER_BOUND + i * 7));
    return text;
}

static BenchResult bench_cipher(const std::string& algo, const Cipher& cipher, size_t dataSize, size_t iters)
{
    std::string pt = makePlaintext(dataSize);

    // Warmup
    auto ct = cipher.encrypt(pt);

    auto start = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        ct = cipher.encrypt(pt);
    }
    auto end = Clock::now();

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    double seconds = dur > 0 ? dur / 1e6 : 1e-6;
    double total_bytes = static_cast<double>(dataSize) * iters;
    double mbps = (total_bytes / (1024.0 * 1024.0)) / seconds;
    double usec_per_op = static_cast<double>(dur) / iters;

    return { algo, dataSize, mbps, usec_per_op };
}

int main(int argc, char** argv)
{
    std::string outFile = "bench_results.csv";
    size_t iters = 100;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--iters") == 0 && i + 1 < argc) {
            iters = std::stoul(argv[++i]);
        }
    }
    if (iters == 0)
        iters = 1;

    std::vector<size_t> sizes = { 1024, 4096, 16384, 65536, 262144 };
    std::vector<BenchResult> results;

    Caesar caesar(3);
    Bellaso bellaso("LEMON");

    std::cerr << "[*] Starting benchmarks (iters=" << iters << ")...\n";

    for (auto size : sizes) {
        std::cerr << "[*] Caesar size=" << size << "\n";
        results.push_back(bench_cipher("Caesar", caesar, size, iters));
        std::cerr << "[*] Bellaso size=" << size << "\n";
        results.push_back(bench_cipher("Bellaso", bellaso, size, iters));
    }

    std::ofstream ofs(outFile);
    if (!ofs) {
        std::cerr << "[!] Cannot open " << outFile << " for writing\n";
        return 1;
    }
    ofs << "algo,size_bytes,throughput_MBps,latency_usec\n";
    for (auto& r : results) {
        ofs << r.algo << ","
            << r.size << ","
            << std::fixed << std::setprecision(2) << r.mbps << ","
            << std::fixed << std::setprecision(2) << r.usec_per_op << "\n";
    }

    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(10) << "Algorithm"
              << std::setw(12) << "Size"
              << std::setw(14) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(48, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(10) << r.algo
                  << std::setw(12) << r.size
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.mbps << " MB/s"
                  << std::setw(10) << r.usec_per_op << " us\n";
    }

    return 0;
}
