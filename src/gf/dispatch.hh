#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rsec {

// ============================================================================
// Instruction Set Levels
// ============================================================================

enum class SimdLevel : std::uint8_t {
    BASE = 0,    // Portable scalar table lookups
    SSSE3 = 1,   // 16 bytes per step via PSHUFB
    AVX2 = 2,    // 32 bytes per step via VPSHUFB
};

[[nodiscard]] constexpr std::string_view simd_level_name(SimdLevel level) {
    switch (level) {
        case SimdLevel::BASE: return "base";
        case SimdLevel::SSSE3: return "ssse3";
        case SimdLevel::AVX2: return "avx2";
    }
    return "unknown";
}

// ============================================================================
// Kernel Family
// ============================================================================

// Multiply-accumulate loops over split-nibble tables (see gf/tables.hh).
// Every family produces identical bytes for identical inputs. Buffers must
// not overlap between sources and destination.
struct Kernels {
    SimdLevel level;

    // dest[o] = XOR_i tables[i] * src[i][o], i in [0, vec)
    void (*dot_prod)(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                     const std::uint8_t* const* src, std::uint8_t* dest);

    // dest[o] ^= table * src[o]
    void (*mad)(std::size_t len, const std::uint8_t* table,
                const std::uint8_t* src, std::uint8_t* dest);

    // dest[o] = table * src[o]
    void (*vect_mul)(std::size_t len, const std::uint8_t* table,
                     const std::uint8_t* src, std::uint8_t* dest);
};

// Best level the running CPU supports. Probed once, then cached.
[[nodiscard]] SimdLevel detect_simd_level();

// Kernel family for a level, clamped to detect_simd_level()
[[nodiscard]] const Kernels& kernels_for(SimdLevel level);

// Kernel family for detect_simd_level()
[[nodiscard]] const Kernels& active_kernels();

}  // namespace rsec
