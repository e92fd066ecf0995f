#pragma once

#include "core/types.hh"
#include <array>

namespace rsec {

// ============================================================================
// Galois Field GF(2^8) Arithmetic
// ============================================================================

// Elements are bytes; addition is XOR. Multiplication reduces modulo
// GF_POLYNOMIAL (0x11d). The log/exp tables are built on first use and are
// read-only afterwards, so every member is safe to call from any thread.
class GF256 {
public:
    [[nodiscard]] static gf_t add(gf_t a, gf_t b) { return a ^ b; }
    [[nodiscard]] static gf_t sub(gf_t a, gf_t b) { return a ^ b; }

    [[nodiscard]] static gf_t mul(gf_t a, gf_t b);

    // Throws ErasureError(INVALID_PARAMETERS) when b == 0
    [[nodiscard]] static gf_t div(gf_t a, gf_t b);

    // Throws ErasureError(INVALID_PARAMETERS) when a == 0
    [[nodiscard]] static gf_t inv(gf_t a);

    [[nodiscard]] static gf_t pow(gf_t a, unsigned n);

    // Shift-and-reduce product, no tables. Reference for mul().
    [[nodiscard]] static gf_t mul_slow(gf_t a, gf_t b);

    // Discrete log base 2; undefined for 0
    [[nodiscard]] static std::uint8_t log(gf_t a);
    [[nodiscard]] static gf_t exp(unsigned n);

private:
    struct Tables {
        std::array<std::uint8_t, 256> log;
        std::array<std::uint8_t, 512> exp;
    };

    static const Tables& tables();
};

}  // namespace rsec
