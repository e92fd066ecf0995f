#include "gf/matrix.hh"
#include "gf/gf256.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <sstream>

namespace rsec {

// ============================================================================
// Matrix Implementation
// ============================================================================

Matrix::Matrix(std::size_t rows, std::size_t cols)
    : rows_(rows), cols_(cols), data_(rows * cols, 0) {}

Matrix::Matrix(std::size_t rows, std::size_t cols, std::vector<gf_t> values)
    : rows_(rows), cols_(cols), data_(std::move(values)) {
    if (data_.size() != rows_ * cols_) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "matrix " + std::to_string(rows_) + "x" + std::to_string(cols_) +
            " given " + std::to_string(data_.size()) + " values");
    }
}

Matrix Matrix::identity(std::size_t n) {
    Matrix m(n, n);
    for (std::size_t i = 0; i < n; i++) {
        m.at(i, i) = 1;
    }
    return m;
}

Matrix Matrix::submatrix(std::span<const block_index_t> row_indices) const {
    Matrix out(row_indices.size(), cols_);
    for (std::size_t r = 0; r < row_indices.size(); r++) {
        if (row_indices[r] >= rows_) {
            throw ErasureError(ErrorCode::INVALID_PARAMETERS,
                "row " + std::to_string(row_indices[r]) + " out of range");
        }
        auto src = row(row_indices[r]);
        std::copy(src.begin(), src.end(), out.row(r).begin());
    }
    return out;
}

Matrix Matrix::row_block(std::size_t first, std::size_t count) const {
    if (first + count > rows_) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "row block out of range");
    }
    std::vector<gf_t> values(data_.begin() + static_cast<std::ptrdiff_t>(first * cols_),
                             data_.begin() + static_cast<std::ptrdiff_t>((first + count) * cols_));
    return Matrix(count, cols_, std::move(values));
}

Matrix Matrix::multiply(const Matrix& other) const {
    if (cols_ != other.rows_) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "cannot multiply " + std::to_string(rows_) + "x" + std::to_string(cols_) +
            " by " + std::to_string(other.rows_) + "x" + std::to_string(other.cols_));
    }

    Matrix out(rows_, other.cols_);
    for (std::size_t i = 0; i < rows_; i++) {
        for (std::size_t j = 0; j < other.cols_; j++) {
            gf_t acc = 0;
            for (std::size_t n = 0; n < cols_; n++) {
                acc ^= GF256::mul(at(i, n), other.at(n, j));
            }
            out.at(i, j) = acc;
        }
    }
    return out;
}

std::optional<Matrix> Matrix::invert() const {
    if (rows_ != cols_) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "only square matrices invert");
    }

    const std::size_t n = rows_;
    Matrix work = *this;
    Matrix inverse = identity(n);

    for (std::size_t col = 0; col < n; col++) {
        // Find a nonzero pivot at or below the diagonal
        std::size_t pivot_row = col;
        while (pivot_row < n && work.at(pivot_row, col) == 0) {
            pivot_row++;
        }
        if (pivot_row == n) {
            RSEC_LOG_DEBUG(log::matrix) << "No pivot in column " << col
                                        << " of " << n << "x" << n << " matrix";
            return std::nullopt;
        }

        if (pivot_row != col) {
            std::swap_ranges(work.row(col).begin(), work.row(col).end(),
                             work.row(pivot_row).begin());
            std::swap_ranges(inverse.row(col).begin(), inverse.row(col).end(),
                             inverse.row(pivot_row).begin());
        }

        // Scale pivot row to 1
        gf_t scale = GF256::inv(work.at(col, col));
        for (std::size_t j = 0; j < n; j++) {
            work.at(col, j) = GF256::mul(work.at(col, j), scale);
            inverse.at(col, j) = GF256::mul(inverse.at(col, j), scale);
        }

        // Eliminate the column everywhere else
        for (std::size_t r = 0; r < n; r++) {
            gf_t factor = work.at(r, col);
            if (r == col || factor == 0) {
                continue;
            }
            for (std::size_t j = 0; j < n; j++) {
                work.at(r, j) ^= GF256::mul(factor, work.at(col, j));
                inverse.at(r, j) ^= GF256::mul(factor, inverse.at(col, j));
            }
        }
    }

    return inverse;
}

bool Matrix::is_systematic() const {
    if (rows_ < cols_) {
        return false;
    }
    for (std::size_t i = 0; i < cols_; i++) {
        for (std::size_t j = 0; j < cols_; j++) {
            if (at(i, j) != (i == j ? 1 : 0)) {
                return false;
            }
        }
    }
    return true;
}

std::string Matrix::to_string() const {
    std::ostringstream oss;
    for (std::size_t r = 0; r < rows_; r++) {
        oss << bytes_to_hex(row(r));
        if (r + 1 < rows_) {
            oss << '\n';
        }
    }
    return oss.str();
}

// ============================================================================
// Generator Matrices
// ============================================================================

namespace {

void check_dimensions(std::size_t k, std::size_t p) {
    if (k == 0) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "k must be positive");
    }
    if (k > MAX_TOTAL_BLOCKS || p > MAX_TOTAL_BLOCKS - k) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "k=" + std::to_string(k) + " p=" + std::to_string(p) +
            " exceeds field size " + std::to_string(MAX_TOTAL_BLOCKS));
    }
}

}  // namespace

Matrix generate_cauchy(std::size_t k, std::size_t p) {
    check_dimensions(k, p);

    Matrix m(k + p, k);
    for (std::size_t i = 0; i < k; i++) {
        m.at(i, i) = 1;
    }

    // i >= k > j, so i ^ j is never zero
    for (std::size_t i = k; i < k + p; i++) {
        for (std::size_t j = 0; j < k; j++) {
            m.at(i, j) = GF256::inv(static_cast<gf_t>(i ^ j));
        }
    }

    RSEC_LOG_TRACE(log::matrix) << "Cauchy generator k=" << k << " p=" << p;
    return m;
}

Matrix generate_vandermonde(std::size_t k, std::size_t p) {
    check_dimensions(k, p);

    Matrix m(k + p, k);
    for (std::size_t i = 0; i < k; i++) {
        m.at(i, i) = 1;
    }

    gf_t base = 1;
    for (std::size_t i = k; i < k + p; i++) {
        gf_t gen = 1;
        for (std::size_t j = 0; j < k; j++) {
            m.at(i, j) = gen;
            gen = GF256::mul(gen, base);
        }
        base = GF256::mul(base, 2);
    }

    RSEC_LOG_TRACE(log::matrix) << "Vandermonde generator k=" << k << " p=" << p;
    return m;
}

Matrix generate(MatrixKind kind, std::size_t k, std::size_t p) {
    switch (kind) {
        case MatrixKind::CAUCHY: return generate_cauchy(k, p);
        case MatrixKind::VANDERMONDE: return generate_vandermonde(k, p);
    }
    throw ErasureError(ErrorCode::INVALID_PARAMETERS, "unknown matrix kind");
}

bool is_mds(const Matrix& generator) {
    const std::size_t k = generator.cols();
    const std::size_t n = generator.rows();
    if (k == 0 || n < k) {
        return false;
    }

    // Walk every k-subset of [0, n) in lexicographic order
    std::vector<block_index_t> pick(k);
    for (std::size_t i = 0; i < k; i++) {
        pick[i] = static_cast<block_index_t>(i);
    }

    while (true) {
        if (!generator.submatrix(pick).invert()) {
            return false;
        }

        std::size_t i = k;
        while (i > 0 && pick[i - 1] == n - k + i - 1) {
            --i;
        }
        if (i == 0) {
            return true;
        }
        ++pick[i - 1];
        for (std::size_t j = i; j < k; j++) {
            pick[j] = pick[j - 1] + 1;
        }
    }
}

}  // namespace rsec
