#pragma once

#include "core/types.hh"
#include "gf/matrix.hh"
#include <span>
#include <vector>

namespace rsec {

// ============================================================================
// Split-Nibble Multiplication Tables
// ============================================================================

// Fills out[0..31] for coefficient c:
//   out[x]      = c * x         for x in 0..15
//   out[16 + x] = c * (x << 4)  for x in 0..15
// so c * b == out[b & 15] ^ out[16 + (b >> 4)].
void init_mul_table(gf_t c, std::span<std::uint8_t, GF_TABLE_SIZE> out);

// Product through a table built by init_mul_table
[[nodiscard]] inline gf_t table_mul(const std::uint8_t* table, std::uint8_t b) {
    return table[b & 0x0f] ^ table[GF_TABLE_HALF + (b >> 4)];
}

// ============================================================================
// Encoding Table Set
// ============================================================================

// One 32-byte table per coefficient of a rows x k block, row-major:
// the table for (r, c) starts at byte (r * k + c) * 32.
class EncodeTables {
public:
    EncodeTables() = default;

    // Tables for an arbitrary rows x k block of coefficients
    [[nodiscard]] static EncodeTables build(const Matrix& coefficients);

    [[nodiscard]] std::size_t data_blocks() const { return k_; }
    [[nodiscard]] std::size_t rows() const { return rows_; }
    [[nodiscard]] bool empty() const { return bytes_.empty(); }

    // The k * 32 bytes used to produce output row r
    [[nodiscard]] const std::uint8_t* row(std::size_t r) const {
        return bytes_.data() + r * k_ * GF_TABLE_SIZE;
    }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const { return bytes_; }

    bool operator==(const EncodeTables&) const = default;

private:
    std::size_t k_ = 0;
    std::size_t rows_ = 0;
    std::vector<std::uint8_t> bytes_;
};

// Tables for the p parity rows of a (k + p) x k generator. Throws
// ErasureError(INVALID_PARAMETERS) when the matrix shape disagrees with k, p.
[[nodiscard]] EncodeTables build_tables(const Matrix& generator, std::size_t k, std::size_t p);

}  // namespace rsec
