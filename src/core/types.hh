#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace rsec {

// ============================================================================
// Field Constants
// ============================================================================

// GF(2^8): every element fits in one byte
inline constexpr std::size_t GF_FIELD_SIZE = 256;

// Generator polynomial: x^8 + x^4 + x^3 + x^2 + 1 (0x11d)
inline constexpr std::uint16_t GF_POLYNOMIAL = 0x11d;

// Largest k + p a generator matrix can have
inline constexpr std::size_t MAX_TOTAL_BLOCKS = GF_FIELD_SIZE;

// Split-nibble multiplication table: 16 low-nibble products, 16 high-nibble products
inline constexpr std::size_t GF_TABLE_SIZE = 32;
inline constexpr std::size_t GF_TABLE_HALF = 16;

// ============================================================================
// Hash Constants
// ============================================================================

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// ============================================================================
// Core Type Aliases
// ============================================================================

using gf_t = std::uint8_t;
using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using block_index_t = std::uint32_t;

// Block views. Every buffer carries its own length.
using ConstBlock = std::span<const std::uint8_t>;
using MutableBlock = std::span<std::uint8_t>;

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           (static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (int i = 7; i >= 0; --i) {
        val = (val << 8) | src[i];
    }
    return val;
}

// ============================================================================
// Hex Encoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);

}  // namespace rsec
