#include "codec/decoder.hh"
#include "codec/encoder.hh"
#include "gf/tables.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <string>

namespace rsec {

namespace {

void check_generator(const Matrix& generator) {
    if (generator.cols() == 0 || generator.rows() < generator.cols() ||
        generator.rows() > MAX_TOTAL_BLOCKS) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "unusable generator shape " + std::to_string(generator.rows()) + "x" +
            std::to_string(generator.cols()));
    }
}

}  // namespace

void validate_erasures(std::size_t k, std::size_t p, std::span<const block_index_t> erasures) {
    if (k == 0 || k > MAX_TOTAL_BLOCKS || p > MAX_TOTAL_BLOCKS - k) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "unsupported geometry k=" + std::to_string(k) + " p=" + std::to_string(p));
    }
    const std::size_t n = k + p;
    std::vector<bool> seen(n, false);

    for (block_index_t index : erasures) {
        if (index >= n) {
            throw ErasureError(ErrorCode::INVALID_PARAMETERS,
                "erasure index " + std::to_string(index) + " outside [0, " +
                std::to_string(n) + ")");
        }
        if (seen[index]) {
            throw ErasureError(ErrorCode::INVALID_PARAMETERS,
                "erasure index " + std::to_string(index) + " listed twice");
        }
        seen[index] = true;
    }

    if (erasures.size() > p) {
        log::decode.warn() << erasures.size() << " blocks lost, only " << p
                           << " can be recovered";
        throw ErasureError(ErrorCode::UNRECOVERABLE_LOSS,
            std::to_string(erasures.size()) + " erasures exceed " + std::to_string(p) +
            " parity blocks");
    }
}

DecodePlan decode_matrix(const Matrix& generator, std::span<const block_index_t> erasures) {
    check_generator(generator);
    const std::size_t k = generator.cols();
    const std::size_t n = generator.rows();
    validate_erasures(k, n - k, erasures);

    std::vector<bool> erased(n, false);
    for (block_index_t index : erasures) {
        erased[index] = true;
    }

    DecodePlan plan;
    plan.survivors.reserve(k);
    for (std::size_t i = 0; i < n && plan.survivors.size() < k; i++) {
        if (!erased[i]) {
            plan.survivors.push_back(static_cast<block_index_t>(i));
        }
    }

    auto inverse = generator.submatrix(plan.survivors).invert();
    if (!inverse) {
        log::decode.error() << "Survivor rows do not invert for "
                            << erasures.size() << " erasures";
        throw ErasureError(ErrorCode::SINGULAR_SUBMATRIX,
            "no pivot while inverting the surviving rows");
    }

    // Block e is generator row e applied to the data, and the data is the
    // inverse applied to the survivors. With an identity top, data rows are
    // just rows of the inverse.
    const bool systematic = generator.is_systematic();
    plan.coefficients = Matrix(erasures.size(), k);
    for (std::size_t r = 0; r < erasures.size(); r++) {
        const block_index_t e = erasures[r];
        auto out = plan.coefficients.row(r);
        if (systematic && e < k) {
            auto src = inverse->row(e);
            std::copy(src.begin(), src.end(), out.begin());
            continue;
        }
        auto gen_row = generator.row_block(e, 1);
        auto folded = gen_row.multiply(*inverse);
        auto src = folded.row(0);
        std::copy(src.begin(), src.end(), out.begin());
    }

    return plan;
}

void decode(const Matrix& generator,
            std::size_t len,
            std::span<const block_index_t> erasures,
            std::span<const ConstBlock> blocks,
            std::span<const MutableBlock> reconstructed,
            const Kernels& kernels) {
    check_generator(generator);
    const std::size_t k = generator.cols();
    const std::size_t n = generator.rows();
    validate_erasures(k, n - k, erasures);

    if (blocks.size() != n) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "expected " + std::to_string(n) + " block slots, got " +
            std::to_string(blocks.size()));
    }
    if (reconstructed.size() != erasures.size()) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            std::to_string(reconstructed.size()) + " output buffers for " +
            std::to_string(erasures.size()) + " erasures");
    }

    std::vector<bool> erased(n, false);
    for (block_index_t index : erasures) {
        erased[index] = true;
    }
    for (std::size_t i = 0; i < n; i++) {
        if (!erased[i] && blocks[i].size() != len) {
            throw ErasureError(ErrorCode::INVALID_PARAMETERS,
                "surviving block " + std::to_string(i) + " holds " +
                std::to_string(blocks[i].size()) + " bytes, expected " +
                std::to_string(len));
        }
    }
    detail::check_block_lengths(len, reconstructed, "reconstructed");

    if (erasures.empty() || len == 0) {
        return;
    }

    auto plan = decode_matrix(generator, erasures);
    auto tables = EncodeTables::build(plan.coefficients);

    std::vector<const std::uint8_t*> sources(k);
    for (std::size_t i = 0; i < k; i++) {
        sources[i] = blocks[plan.survivors[i]].data();
    }
    std::vector<std::uint8_t*> outputs(erasures.size());
    for (std::size_t r = 0; r < erasures.size(); r++) {
        outputs[r] = reconstructed[r].data();
    }

    RSEC_LOG_DEBUG(log::decode) << "Recovering " << erasures.size() << " of " << n
                                << " blocks, len=" << len;
    detail::apply_tables(len, tables, sources, outputs, kernels);
}

}  // namespace rsec
