#include <gtest/gtest.h>
#include "core/error.hh"
#include "core/types.hh"
#include <array>

using namespace rsec;

// ============================================================================
// Hex Encoding Tests
// ============================================================================

TEST(TypesTest, BytesToHex) {
    std::vector<std::uint8_t> bytes = {0x00, 0x01, 0x0a, 0xff};
    std::string hex = bytes_to_hex(bytes);
    EXPECT_EQ(hex, "00010aff");
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(TypesTest, EncodeDecodeU16) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), 0x1234);
    EXPECT_EQ(buf[0], 0x34);  // Little-endian
    EXPECT_EQ(decode_u16(buf.data()), 0x1234);
}

TEST(TypesTest, EncodeDecodeU32) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), 0x12345678);
    EXPECT_EQ(buf[0], 0x78);
    EXPECT_EQ(decode_u32(buf.data()), 0x12345678);
}

TEST(TypesTest, EncodeDecodeU64) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), 0x123456789ABCDEF0ULL);
    EXPECT_EQ(buf[0], 0xF0);
    EXPECT_EQ(decode_u64(buf.data()), 0x123456789ABCDEF0ULL);
}

// ============================================================================
// Constants Validation Tests
// ============================================================================

TEST(ConstantsTest, FieldConstants) {
    EXPECT_EQ(GF_FIELD_SIZE, 256);
    EXPECT_EQ(GF_POLYNOMIAL, 0x11d);
    EXPECT_EQ(MAX_TOTAL_BLOCKS, 256);
    EXPECT_EQ(GF_TABLE_SIZE, 2 * GF_TABLE_HALF);
    EXPECT_EQ(HASH_SIZE, 32);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(error_code_string(ErrorCode::OK), "ok");
    EXPECT_EQ(error_code_string(ErrorCode::INVALID_PARAMETERS), "invalid_parameters");
    EXPECT_EQ(error_code_string(ErrorCode::UNRECOVERABLE_LOSS), "unrecoverable_loss");
    EXPECT_EQ(error_code_string(ErrorCode::SINGULAR_SUBMATRIX), "singular_submatrix");
}

TEST(ErrorTest, MessageCarriesCode) {
    ErasureError err(ErrorCode::UNRECOVERABLE_LOSS, "3 erasures exceed 2 parity blocks");
    EXPECT_EQ(err.code(), ErrorCode::UNRECOVERABLE_LOSS);
    EXPECT_STREQ(err.what(), "unrecoverable_loss: 3 erasures exceed 2 parity blocks");
}

TEST(ErrorTest, CatchableAsRuntimeError) {
    try {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "k must be positive");
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("k must be positive"), std::string::npos);
        return;
    }
    FAIL() << "ErasureError was not caught as std::runtime_error";
}
