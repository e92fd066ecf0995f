#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rsec {

// ============================================================================
// Generator Construction
// ============================================================================

enum class MatrixKind : std::uint8_t {
    CAUCHY = 0,        // MDS for any k + p <= 256
    VANDERMONDE = 1,   // Powers of 2^r; not MDS for every (k, p)
};

[[nodiscard]] constexpr std::string_view matrix_kind_name(MatrixKind kind) {
    switch (kind) {
        case MatrixKind::CAUCHY: return "cauchy";
        case MatrixKind::VANDERMONDE: return "vandermonde";
    }
    return "unknown";
}

// ============================================================================
// Matrix over GF(2^8)
// ============================================================================

// Dense row-major matrix of field elements.
class Matrix {
public:
    Matrix() = default;
    Matrix(std::size_t rows, std::size_t cols);
    Matrix(std::size_t rows, std::size_t cols, std::vector<gf_t> values);

    [[nodiscard]] static Matrix identity(std::size_t n);

    [[nodiscard]] std::size_t rows() const { return rows_; }
    [[nodiscard]] std::size_t cols() const { return cols_; }
    [[nodiscard]] bool empty() const { return data_.empty(); }

    [[nodiscard]] gf_t at(std::size_t r, std::size_t c) const { return data_[r * cols_ + c]; }
    [[nodiscard]] gf_t& at(std::size_t r, std::size_t c) { return data_[r * cols_ + c]; }

    [[nodiscard]] std::span<const gf_t> row(std::size_t r) const {
        return {data_.data() + r * cols_, cols_};
    }
    [[nodiscard]] std::span<gf_t> row(std::size_t r) {
        return {data_.data() + r * cols_, cols_};
    }

    [[nodiscard]] std::span<const gf_t> data() const { return data_; }

    // Rows picked in the given order; every index must be < rows()
    [[nodiscard]] Matrix submatrix(std::span<const block_index_t> row_indices) const;

    // Rows [first, first + count)
    [[nodiscard]] Matrix row_block(std::size_t first, std::size_t count) const;

    // this * other; throws ErasureError(INVALID_PARAMETERS) on a shape mismatch
    [[nodiscard]] Matrix multiply(const Matrix& other) const;

    // Gauss-Jordan inverse of a square matrix. nullopt when singular.
    [[nodiscard]] std::optional<Matrix> invert() const;

    // Top cols() rows form the identity
    [[nodiscard]] bool is_systematic() const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Matrix&) const = default;

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<gf_t> data_;
};

// ============================================================================
// Generator Matrices
// ============================================================================

// All generators return a systematic (k + p) x k matrix and throw
// ErasureError(INVALID_PARAMETERS) for k == 0 or k + p > 256.

// Parity entry (i, j) = 1 / (i ^ j) for k <= i < k + p, 0 <= j < k
[[nodiscard]] Matrix generate_cauchy(std::size_t k, std::size_t p);

// Parity row k + r holds (2^r)^j
[[nodiscard]] Matrix generate_vandermonde(std::size_t k, std::size_t p);

[[nodiscard]] Matrix generate(MatrixKind kind, std::size_t k, std::size_t p);

// Checks that every k-row subset of a (k + p) x k generator inverts.
// Exponential in p; meant for tests and small configurations.
[[nodiscard]] bool is_mds(const Matrix& generator);

}  // namespace rsec
