#include "gf/tables.hh"
#include "gf/gf256.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <string>

namespace rsec {

void init_mul_table(gf_t c, std::span<std::uint8_t, GF_TABLE_SIZE> out) {
    for (unsigned x = 0; x < GF_TABLE_HALF; x++) {
        out[x] = GF256::mul(c, static_cast<gf_t>(x));
        out[GF_TABLE_HALF + x] = GF256::mul(c, static_cast<gf_t>(x << 4));
    }
}

EncodeTables EncodeTables::build(const Matrix& coefficients) {
    EncodeTables t;
    t.k_ = coefficients.cols();
    t.rows_ = coefficients.rows();
    t.bytes_.resize(t.k_ * t.rows_ * GF_TABLE_SIZE);

    std::uint8_t* out = t.bytes_.data();
    for (gf_t c : coefficients.data()) {
        init_mul_table(c, std::span<std::uint8_t, GF_TABLE_SIZE>(out, GF_TABLE_SIZE));
        out += GF_TABLE_SIZE;
    }
    return t;
}

EncodeTables build_tables(const Matrix& generator, std::size_t k, std::size_t p) {
    if (k > MAX_TOTAL_BLOCKS || p > MAX_TOTAL_BLOCKS - k ||
        generator.cols() != k || generator.rows() != k + p) {
        log::tables.error() << "Generator is " << generator.rows() << "x" << generator.cols()
                            << ", expected " << (k + p) << "x" << k;
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "generator shape does not match k=" + std::to_string(k) +
            " p=" + std::to_string(p));
    }

    auto tables = EncodeTables::build(generator.row_block(k, p));
    RSEC_LOG_DEBUG(log::tables) << "Built " << k * p << " coefficient tables ("
                                << tables.bytes().size() << " bytes)";
    return tables;
}

}  // namespace rsec
