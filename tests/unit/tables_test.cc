#include <gtest/gtest.h>
#include "core/error.hh"
#include "gf/gf256.hh"
#include "gf/tables.hh"
#include <algorithm>

using namespace rsec;

// ============================================================================
// Single Coefficient Tables
// ============================================================================

TEST(MulTableTest, TableProductMatchesField) {
    std::array<std::uint8_t, GF_TABLE_SIZE> table{};

    for (int c = 0; c < 256; c++) {
        init_mul_table(static_cast<gf_t>(c), table);
        for (int b = 0; b < 256; b++) {
            ASSERT_EQ(table_mul(table.data(), static_cast<std::uint8_t>(b)),
                      GF256::mul(static_cast<gf_t>(c), static_cast<gf_t>(b)))
                << "c = " << c << ", b = " << b;
        }
    }
}

TEST(MulTableTest, Layout) {
    std::array<std::uint8_t, GF_TABLE_SIZE> table{};
    init_mul_table(0x02, table);

    EXPECT_EQ(table[0], 0x00);
    EXPECT_EQ(table[1], 0x02);
    EXPECT_EQ(table[15], 0x1E);
    EXPECT_EQ(table[GF_TABLE_HALF + 0], 0x00);
    EXPECT_EQ(table[GF_TABLE_HALF + 1], 0x20);   // 2 * 0x10
    EXPECT_EQ(table[GF_TABLE_HALF + 8], 0x1D);   // 2 * 0x80 reduced
}

TEST(MulTableTest, ZeroAndOne) {
    std::array<std::uint8_t, GF_TABLE_SIZE> zero{};
    std::array<std::uint8_t, GF_TABLE_SIZE> one{};
    zero.fill(0xAA);
    init_mul_table(0, zero);
    init_mul_table(1, one);

    for (std::size_t x = 0; x < GF_TABLE_HALF; x++) {
        EXPECT_EQ(zero[x], 0);
        EXPECT_EQ(zero[GF_TABLE_HALF + x], 0);
        EXPECT_EQ(one[x], x);
        EXPECT_EQ(one[GF_TABLE_HALF + x], x << 4);
    }
}

// ============================================================================
// Encoding Table Sets
// ============================================================================

TEST(EncodeTablesTest, RowMajorPerCoefficient) {
    Matrix coefficients(2, 3, {1, 2, 3, 4, 5, 6});
    auto tables = EncodeTables::build(coefficients);

    EXPECT_EQ(tables.data_blocks(), 3);
    EXPECT_EQ(tables.rows(), 2);
    EXPECT_EQ(tables.bytes().size(), 2 * 3 * GF_TABLE_SIZE);

    std::array<std::uint8_t, GF_TABLE_SIZE> expected{};
    for (std::size_t r = 0; r < 2; r++) {
        for (std::size_t c = 0; c < 3; c++) {
            init_mul_table(coefficients.at(r, c), expected);
            const std::uint8_t* got = tables.row(r) + c * GF_TABLE_SIZE;
            EXPECT_TRUE(std::equal(expected.begin(), expected.end(), got))
                << "row " << r << " col " << c;
        }
    }
}

TEST(EncodeTablesTest, BuildIsDeterministic) {
    auto generator = generate_cauchy(10, 4);
    EXPECT_EQ(build_tables(generator, 10, 4), build_tables(generator, 10, 4));
}

TEST(EncodeTablesTest, ParityRowsOnly) {
    auto generator = generate_cauchy(5, 3);
    auto tables = build_tables(generator, 5, 3);

    EXPECT_EQ(tables.rows(), 3);
    EXPECT_EQ(tables.bytes().size(), 5 * 3 * GF_TABLE_SIZE);
    EXPECT_EQ(tables, EncodeTables::build(generator.row_block(5, 3)));
}

TEST(EncodeTablesTest, ZeroParityIsEmpty) {
    auto tables = build_tables(generate_cauchy(4, 0), 4, 0);
    EXPECT_TRUE(tables.empty());
    EXPECT_EQ(tables.rows(), 0);
}

TEST(EncodeTablesTest, ShapeMismatchThrows) {
    auto generator = generate_cauchy(5, 3);
    EXPECT_THROW((void)build_tables(generator, 4, 3), ErasureError);
    EXPECT_THROW((void)build_tables(generator, 5, 2), ErasureError);
}
