#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "core/CipherCodec.hpp"

// Codec keeps no state, concurrent callers must see the same results as a single thread
TEST(CipherCodecConcurrency, ParallelRoundTrips)
{
    const std::string plain = "CONCURRENT CALLS SHARE NOTHING 0123456789";
    const std::string expectedCaesar = CipherCodec::encryptCaesar(plain, 17);
    const std::string expectedBellaso = CipherCodec::encryptBellaso(plain, "LEMON");

    std::atomic<int> failures{ 0 };
    std::vector<std::thread> workers;

    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < 500; ++i) {
                if (CipherCodec::encryptCaesar(plain, 17) != expectedCaesar) ++failures;
                if (CipherCodec::encryptBellaso(plain, "LEMON") != expectedBellaso) ++failures;

                const int key = t * 1000 + i;
                if (CipherCodec::decryptCaesar(CipherCodec::encryptCaesar(plain, key), key) != plain) ++failures;
            }
        });
    }
    for (auto& w : workers)
        w.join();

    EXPECT_EQ(failures.load(), 0);
}
