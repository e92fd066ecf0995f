#include <gtest/gtest.h>
#include "core/error.hh"
#include "gf/gf256.hh"
#include "gf/matrix.hh"
#include <random>

using namespace rsec;

// ============================================================================
// Matrix Basics
// ============================================================================

TEST(MatrixTest, ConstructZeroed) {
    Matrix m(2, 3);
    EXPECT_EQ(m.rows(), 2);
    EXPECT_EQ(m.cols(), 3);
    for (auto v : m.data()) {
        EXPECT_EQ(v, 0);
    }
}

TEST(MatrixTest, ValueCountMustMatchShape) {
    EXPECT_THROW(Matrix(2, 2, {1, 2, 3}), ErasureError);
    EXPECT_NO_THROW(Matrix(2, 2, {1, 2, 3, 4}));
}

TEST(MatrixTest, SubmatrixPicksRowsInOrder) {
    Matrix m(3, 2, {1, 2, 3, 4, 5, 6});
    std::vector<block_index_t> rows = {2, 0};

    auto sub = m.submatrix(rows);
    EXPECT_EQ(sub, Matrix(2, 2, {5, 6, 1, 2}));

    std::vector<block_index_t> bad = {3};
    EXPECT_THROW((void)m.submatrix(bad), ErasureError);
}

TEST(MatrixTest, RowBlock) {
    Matrix m(3, 2, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(m.row_block(1, 2), Matrix(2, 2, {3, 4, 5, 6}));
    EXPECT_THROW((void)m.row_block(2, 2), ErasureError);
}

TEST(MatrixTest, MultiplyByIdentity) {
    Matrix m(2, 3, {7, 0, 9, 1, 200, 3});
    EXPECT_EQ(Matrix::identity(2).multiply(m), m);
    EXPECT_EQ(m.multiply(Matrix::identity(3)), m);
    EXPECT_THROW((void)m.multiply(Matrix::identity(2)), ErasureError);
}

TEST(MatrixTest, ToStringIsHexRows) {
    Matrix m(2, 2, {0x01, 0xab, 0x00, 0xff});
    EXPECT_EQ(m.to_string(), "01ab\n00ff");
}

// ============================================================================
// Inversion
// ============================================================================

TEST(MatrixTest, InvertRandom) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);

    int inverted = 0;
    for (int trial = 0; trial < 50; trial++) {
        const std::size_t n = 1 + trial % 8;
        Matrix m(n, n);
        for (std::size_t r = 0; r < n; r++) {
            for (std::size_t c = 0; c < n; c++) {
                m.at(r, c) = static_cast<gf_t>(byte(rng));
            }
        }

        auto inverse = m.invert();
        if (!inverse) {
            continue;
        }
        inverted++;
        EXPECT_EQ(m.multiply(*inverse), Matrix::identity(n));
        EXPECT_EQ(inverse->multiply(m), Matrix::identity(n));
    }
    EXPECT_GT(inverted, 40);
}

TEST(MatrixTest, InvertNeedsRowSwap) {
    // Zero on the leading diagonal
    Matrix m(2, 2, {0, 1, 1, 0});
    auto inverse = m.invert();
    ASSERT_TRUE(inverse.has_value());
    EXPECT_EQ(*inverse, m);
}

TEST(MatrixTest, InvertSingular) {
    Matrix duplicate_rows(2, 2, {3, 5, 3, 5});
    EXPECT_FALSE(duplicate_rows.invert().has_value());

    Matrix zero_column(3, 3, {1, 0, 2, 4, 0, 6, 7, 0, 9});
    EXPECT_FALSE(zero_column.invert().has_value());
}

TEST(MatrixTest, InvertNonSquareThrows) {
    EXPECT_THROW((void)Matrix(2, 3).invert(), ErasureError);
}

// ============================================================================
// Generator Tests
// ============================================================================

TEST(GeneratorTest, CauchyLayout) {
    auto m = generate_cauchy(3, 2);
    ASSERT_EQ(m.rows(), 5);
    ASSERT_EQ(m.cols(), 3);
    EXPECT_TRUE(m.is_systematic());

    for (std::size_t i = 3; i < 5; i++) {
        for (std::size_t j = 0; j < 3; j++) {
            EXPECT_EQ(m.at(i, j), GF256::inv(static_cast<gf_t>(i ^ j)));
        }
    }
    EXPECT_EQ(m.at(3, 0), GF256::inv(3));
    EXPECT_EQ(m.at(4, 1), GF256::inv(5));
}

TEST(GeneratorTest, VandermondeLayout) {
    auto m = generate_vandermonde(4, 3);
    ASSERT_EQ(m.rows(), 7);
    EXPECT_TRUE(m.is_systematic());

    // Row k is all ones, row k + r holds powers of 2^r
    for (std::size_t j = 0; j < 4; j++) {
        EXPECT_EQ(m.at(4, j), 1);
        EXPECT_EQ(m.at(5, j), GF256::pow(2, static_cast<unsigned>(j)));
        EXPECT_EQ(m.at(6, j), GF256::pow(4, static_cast<unsigned>(j)));
    }
}

TEST(GeneratorTest, GenerateDispatchesOnKind) {
    EXPECT_EQ(generate(MatrixKind::CAUCHY, 5, 3), generate_cauchy(5, 3));
    EXPECT_EQ(generate(MatrixKind::VANDERMONDE, 5, 3), generate_vandermonde(5, 3));
    EXPECT_EQ(matrix_kind_name(MatrixKind::CAUCHY), "cauchy");
}

TEST(GeneratorTest, ZeroParityIsIdentity) {
    EXPECT_EQ(generate_cauchy(4, 0), Matrix::identity(4));
}

TEST(GeneratorTest, RejectsBadDimensions) {
    for (auto kind : {MatrixKind::CAUCHY, MatrixKind::VANDERMONDE}) {
        try {
            (void)generate(kind, 0, 4);
            FAIL() << "k = 0 accepted";
        } catch (const ErasureError& e) {
            EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMETERS);
        }
        EXPECT_THROW((void)generate(kind, 200, 57), ErasureError);
        // k + p would wrap to 1
        EXPECT_THROW((void)generate(kind, 2, static_cast<std::size_t>(-1)), ErasureError);
        EXPECT_THROW((void)generate(kind, static_cast<std::size_t>(-1), 2), ErasureError);
    }
}

TEST(GeneratorTest, LargestGeometry) {
    auto m = generate_cauchy(128, 128);
    EXPECT_EQ(m.rows(), MAX_TOTAL_BLOCKS);
    EXPECT_TRUE(m.is_systematic());
    for (std::size_t i = 128; i < 256; i++) {
        for (std::size_t j = 0; j < 128; j++) {
            ASSERT_NE(m.at(i, j), 0);
        }
    }
}

TEST(GeneratorTest, IdentityTopDetected) {
    Matrix m(3, 2, {1, 0, 0, 1, 5, 6});
    EXPECT_TRUE(m.is_systematic());
    m.at(1, 0) = 1;
    EXPECT_FALSE(m.is_systematic());
}

// ============================================================================
// MDS Property
// ============================================================================

TEST(MdsTest, CauchyIsMds) {
    EXPECT_TRUE(is_mds(generate_cauchy(1, 1)));
    EXPECT_TRUE(is_mds(generate_cauchy(4, 3)));
    EXPECT_TRUE(is_mds(generate_cauchy(6, 4)));
    EXPECT_TRUE(is_mds(generate_cauchy(10, 2)));
}

TEST(MdsTest, VandermondeTwoParityIsMds) {
    EXPECT_TRUE(is_mds(generate_vandermonde(4, 2)));
    EXPECT_TRUE(is_mds(generate_vandermonde(12, 2)));
}

TEST(MdsTest, RepeatedParityRowIsNotMds) {
    // Parity row equal to data row 1: losing rows 0 and 1 is fatal
    Matrix m(3, 2, {1, 0, 0, 1, 0, 1});
    EXPECT_FALSE(is_mds(m));
}
