#include <gtest/gtest.h>
#include "core/error.hh"
#include "gf/gf256.hh"
#include <thread>
#include <vector>

using namespace rsec;

// ============================================================================
// Field Arithmetic Tests
// ============================================================================

TEST(GF256Test, Addition) {
    EXPECT_EQ(GF256::add(0x00, 0x00), 0x00);
    EXPECT_EQ(GF256::add(0xFF, 0x00), 0xFF);
    EXPECT_EQ(GF256::add(0xFF, 0xFF), 0x00);  // XOR
    EXPECT_EQ(GF256::add(0x53, 0x2A), 0x79);
    EXPECT_EQ(GF256::sub(0x53, 0x2A), 0x79);
}

TEST(GF256Test, Multiplication) {
    EXPECT_EQ(GF256::mul(0x00, 0x53), 0x00);
    EXPECT_EQ(GF256::mul(0x53, 0x00), 0x00);
    EXPECT_EQ(GF256::mul(0x01, 0x53), 0x53);
    EXPECT_EQ(GF256::mul(0x02, 0x02), 0x04);
    EXPECT_EQ(GF256::mul(0x80, 0x02), 0x1D);  // Reduced by 0x11d
    EXPECT_EQ(GF256::mul(0x02, 0x8E), 0x01);
}

TEST(GF256Test, MultiplicationMatchesShiftAndReduce) {
    for (int a = 0; a < 256; a++) {
        for (int b = 0; b < 256; b++) {
            auto x = static_cast<gf_t>(a);
            auto y = static_cast<gf_t>(b);
            ASSERT_EQ(GF256::mul(x, y), GF256::mul_slow(x, y)) << a << " * " << b;
        }
    }
}

TEST(GF256Test, MultiplicationCommutes) {
    for (int a = 0; a < 256; a++) {
        for (int b = a; b < 256; b++) {
            auto x = static_cast<gf_t>(a);
            auto y = static_cast<gf_t>(b);
            ASSERT_EQ(GF256::mul(x, y), GF256::mul(y, x));
        }
    }
}

TEST(GF256Test, Inverse) {
    EXPECT_EQ(GF256::inv(0x01), 0x01);
    EXPECT_EQ(GF256::inv(0x02), 0x8E);

    for (int i = 1; i < 256; i++) {
        auto x = static_cast<gf_t>(i);
        EXPECT_EQ(GF256::mul(x, GF256::inv(x)), 0x01) << "Failed for " << i;
    }
}

TEST(GF256Test, Division) {
    for (int a = 0; a < 256; a++) {
        for (int b = 1; b < 256; b++) {
            auto x = static_cast<gf_t>(a);
            auto y = static_cast<gf_t>(b);
            ASSERT_EQ(GF256::mul(GF256::div(x, y), y), x) << a << " / " << b;
        }
    }
}

TEST(GF256Test, ZeroDivisorThrows) {
    try {
        (void)GF256::inv(0);
        FAIL() << "inv(0) did not throw";
    } catch (const ErasureError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMETERS);
    }
    EXPECT_THROW((void)GF256::div(0x17, 0), ErasureError);
    EXPECT_THROW((void)GF256::div(0, 0), ErasureError);
}

TEST(GF256Test, Power) {
    EXPECT_EQ(GF256::pow(0x00, 0), 0x01);
    EXPECT_EQ(GF256::pow(0x00, 5), 0x00);
    EXPECT_EQ(GF256::pow(0x02, 8), 0x1D);
    EXPECT_EQ(GF256::pow(0x02, 255), 0x01);  // Generator order

    gf_t acc = 1;
    for (unsigned n = 0; n < 600; n++) {
        ASSERT_EQ(GF256::pow(0x03, n), acc) << "n = " << n;
        acc = GF256::mul(acc, 0x03);
    }
}

TEST(GF256Test, PowerWithLargeExponent) {
    // Square-and-multiply reference
    auto slow_pow = [](gf_t a, unsigned n) {
        gf_t result = 1;
        while (n != 0) {
            if (n & 1u) result = GF256::mul(result, a);
            a = GF256::mul(a, a);
            n >>= 1;
        }
        return result;
    };

    for (unsigned n : {0x80000001u, 0xFFFFFFFFu, 0x01000000u, 0x7FFFFFFFu, 0xDEADBEEFu}) {
        for (int a = 1; a < 256; a += 17) {
            auto x = static_cast<gf_t>(a);
            EXPECT_EQ(GF256::pow(x, n), slow_pow(x, n)) << "a = " << a << " n = " << n;
        }
    }
}

TEST(GF256Test, LogExpRoundTrip) {
    for (int i = 1; i < 256; i++) {
        auto x = static_cast<gf_t>(i);
        EXPECT_EQ(GF256::exp(GF256::log(x)), x);
    }
    EXPECT_EQ(GF256::exp(0), 0x01);
    EXPECT_EQ(GF256::exp(255), 0x01);
}

TEST(GF256Test, ConcurrentFirstUse) {
    std::vector<std::thread> threads;
    std::vector<int> mismatches(8, 0);

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([t, &mismatches]() {
            for (int a = 0; a < 256; a++) {
                auto x = static_cast<gf_t>(a);
                auto y = static_cast<gf_t>(a * 7 + t);
                if (GF256::mul(x, y) != GF256::mul_slow(x, y)) {
                    mismatches[t]++;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int count : mismatches) {
        EXPECT_EQ(count, 0);
    }
}
