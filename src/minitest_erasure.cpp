// Mini-tests: Reed-Solomon stripe coding (k=8, r=2)

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

#include "erasure_coder.hpp"
#include "errors.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const size_t kStripeLen = 64;

static std::vector<uint8_t> make_stripes(const ErasureCoder& fec, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> stripes(kTotalStripes * kStripeLen, 0);
    for (size_t i = 0; i < kDataStripes * kStripeLen; ++i) stripes[i] = static_cast<uint8_t>(rng() & 0xFF);
    fec.encode(stripes, kStripeLen);
    return stripes;
}

static void wipe(std::vector<uint8_t>& stripes, int stripe, uint8_t value) {
    std::fill(stripes.begin() + stripe * kStripeLen, stripes.begin() + (stripe + 1) * kStripeLen, value);
}

// ------------------ TEST A : first use from several threads ------------------
// Runs before any other coder exists, so the GF(2^8) field is built here.
static bool test_threads() {
    const int kThreads = 4;
    std::vector<int> results(kThreads, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([t, &results] {
            try {
                ErasureCoder fec;
                const auto clean = make_stripes(fec, 100 + t);
                auto damaged = clean;
                wipe(damaged, t % kDataStripes, 0x5A);
                wipe(damaged, kDataStripes, 0x00);
                std::vector<bool> erased(kTotalStripes, false);
                erased[t % kDataStripes] = erased[kDataStripes] = true;
                results[t] = fec.decode(damaged, kStripeLen, erased) && damaged == clean ? 1 : -1;
            } catch (const VaultError& e) {
                std::cerr << "  thread " << t << ": " << e.what() << "\n";
                results[t] = -1;
            }
        });
    }
    for (auto& w : workers) w.join();
    for (int r : results) T_ASSERT(r == 1);
    return true;
}

// ------------------ TEST B : parity ------------------------------------------
static bool test_parity() {
    ErasureCoder fec;
    T_ASSERT(fec.data_stripes() == 8 && fec.parity_stripes() == 2);

    auto stripes = make_stripes(fec, 1);
    T_ASSERT(fec.parity_consistent(stripes, kStripeLen));

    // one flipped data byte breaks parity
    stripes[3 * kStripeLen + 5] ^= 0x10;
    T_ASSERT(!fec.parity_consistent(stripes, kStripeLen));

    // all-zero data has all-zero parity
    std::vector<uint8_t> zeros(kTotalStripes * kStripeLen, 0);
    fec.encode(zeros, kStripeLen);
    for (uint8_t b : zeros) T_ASSERT(b == 0);
    return true;
}

// ------------------ TEST C : rebuild erased stripes --------------------------
static bool test_rebuild() {
    ErasureCoder fec;
    const auto clean = make_stripes(fec, 2);

    // two data stripes
    auto damaged = clean;
    wipe(damaged, 1, 0xAA);
    wipe(damaged, 6, 0x00);
    std::vector<bool> erased(kTotalStripes, false);
    erased[1] = erased[6] = true;
    T_ASSERT(fec.decode(damaged, kStripeLen, erased));
    T_ASSERT(damaged == clean);

    // one data stripe plus one parity stripe
    damaged = clean;
    wipe(damaged, 0, 0x55);
    wipe(damaged, 9, 0x55);
    erased.assign(kTotalStripes, false);
    erased[0] = erased[9] = true;
    T_ASSERT(fec.decode(damaged, kStripeLen, erased));
    T_ASSERT(damaged == clean);

    // nothing erased is a no-op
    damaged = clean;
    erased.assign(kTotalStripes, false);
    T_ASSERT(fec.decode(damaged, kStripeLen, erased));
    T_ASSERT(damaged == clean);
    return true;
}

// ------------------ TEST D : beyond capacity ---------------------------------
static bool test_too_many() {
    ErasureCoder fec;
    const auto clean = make_stripes(fec, 3);

    auto damaged = clean;
    wipe(damaged, 2, 0xFF);
    wipe(damaged, 4, 0xFF);
    wipe(damaged, 5, 0xFF);
    const auto before = damaged;
    std::vector<bool> erased(kTotalStripes, false);
    erased[2] = erased[4] = erased[5] = true;
    T_ASSERT(!fec.decode(damaged, kStripeLen, erased));
    T_ASSERT(damaged == before);   // refused decode leaves the buffer alone

    std::vector<bool> wrong_size(3, true);
    T_ASSERT(!fec.decode(damaged, kStripeLen, wrong_size));
    return true;
}

// ------------------ TEST E : layout checks -----------------------------------
static bool test_layout() {
    ErasureCoder fec;
    std::vector<uint8_t> odd(kTotalStripes * 12, 0);
    bool threw = false;
    try { fec.encode(odd, 12); } catch (const VaultError&) { threw = true; }
    T_ASSERT(threw);

    std::vector<uint8_t> short_buf(kTotalStripes * kStripeLen - 8, 0);
    threw = false;
    try { fec.encode(short_buf, kStripeLen); } catch (const VaultError&) { threw = true; }
    T_ASSERT(threw);
    return true;
}

int main() {
    bool ok = true;

    ok &= test_threads();
    std::cout << "[A] first use from threads : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_parity();
    std::cout << "[B] parity : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_rebuild();
    std::cout << "[C] rebuild <= r stripes : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_too_many();
    std::cout << "[D] more than r erased : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_layout();
    std::cout << "[E] layout checks : " << (ok ? "OK" : "FAIL") << "\n";

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
