#include "codec/encoder.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <array>
#include <string>
#include <vector>

namespace rsec {

namespace detail {

namespace {

template<typename Block>
void check_lengths(std::size_t len, std::span<const Block> blocks, std::string_view what) {
    for (std::size_t i = 0; i < blocks.size(); i++) {
        if (blocks[i].size() != len) {
            log::codec.warn() << what << " block " << i << " holds " << blocks[i].size()
                              << " bytes, expected " << len;
            throw ErasureError(ErrorCode::INVALID_PARAMETERS,
                std::string(what) + " block " + std::to_string(i) + " holds " +
                std::to_string(blocks[i].size()) + " bytes, expected " +
                std::to_string(len));
        }
    }
}

}  // namespace

void check_block_lengths(std::size_t len, std::span<const ConstBlock> blocks,
                         std::string_view what) {
    check_lengths(len, blocks, what);
}

void check_block_lengths(std::size_t len, std::span<const MutableBlock> blocks,
                         std::string_view what) {
    check_lengths(len, blocks, what);
}

void apply_tables(std::size_t len, const EncodeTables& tables,
                  std::span<const std::uint8_t* const> sources,
                  std::span<std::uint8_t* const> outputs,
                  const Kernels& kernels) {
    for (std::size_t r = 0; r < outputs.size(); r++) {
        kernels.dot_prod(len, tables.data_blocks(), tables.row(r), sources.data(), outputs[r]);
    }
}

}  // namespace detail

namespace {

void check_shape(std::size_t k, std::size_t p, const EncodeTables& tables) {
    if (k == 0 || k > MAX_TOTAL_BLOCKS || p > MAX_TOTAL_BLOCKS - k) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "unsupported geometry k=" + std::to_string(k) + " p=" + std::to_string(p));
    }
    if (tables.data_blocks() != k || tables.rows() != p) {
        log::encode.warn() << "Tables built for k=" << tables.data_blocks()
                           << " p=" << tables.rows() << ", called with k=" << k << " p=" << p;
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "encoding tables do not match k=" + std::to_string(k) + " p=" + std::to_string(p));
    }
}

}  // namespace

void encode(std::size_t len, std::size_t k, std::size_t p,
            const EncodeTables& tables,
            std::span<const ConstBlock> data,
            std::span<const MutableBlock> coding,
            const Kernels& kernels) {
    check_shape(k, p, tables);
    if (data.size() != k || coding.size() != p) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "expected " + std::to_string(k) + " data and " + std::to_string(p) +
            " coding blocks, got " + std::to_string(data.size()) + " and " +
            std::to_string(coding.size()));
    }
    detail::check_block_lengths(len, data, "data");
    detail::check_block_lengths(len, coding, "coding");

    if (len == 0 || p == 0) {
        return;
    }

    std::vector<const std::uint8_t*> sources(k);
    for (std::size_t i = 0; i < k; i++) {
        sources[i] = data[i].data();
    }
    std::vector<std::uint8_t*> outputs(p);
    for (std::size_t j = 0; j < p; j++) {
        outputs[j] = coding[j].data();
    }

    RSEC_LOG_TRACE(log::encode) << "encode len=" << len << " k=" << k << " p=" << p
                                << " (" << simd_level_name(kernels.level) << ")";
    detail::apply_tables(len, tables, sources, outputs, kernels);
}

void encode_update(std::size_t len, std::size_t k, std::size_t p, std::size_t source,
                   const EncodeTables& tables,
                   ConstBlock data,
                   std::span<const MutableBlock> coding,
                   const Kernels& kernels) {
    check_shape(k, p, tables);
    if (source >= k) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "source index " + std::to_string(source) + " out of range for k=" +
            std::to_string(k));
    }
    if (coding.size() != p) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "expected " + std::to_string(p) + " coding blocks, got " +
            std::to_string(coding.size()));
    }
    std::array<ConstBlock, 1> single{data};
    detail::check_block_lengths(len, std::span<const ConstBlock>(single), "data");
    detail::check_block_lengths(len, coding, "coding");

    if (len == 0) {
        return;
    }

    for (std::size_t j = 0; j < p; j++) {
        kernels.mad(len, tables.row(j) + source * GF_TABLE_SIZE, data.data(), coding[j].data());
    }
}

void vect_mul(std::size_t len, gf_t c, ConstBlock src, MutableBlock dest,
              const Kernels& kernels) {
    if (src.size() != len || dest.size() != len) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "vect_mul buffers must hold exactly " + std::to_string(len) + " bytes");
    }
    if (len == 0) {
        return;
    }

    std::array<std::uint8_t, GF_TABLE_SIZE> table;
    init_mul_table(c, table);
    kernels.vect_mul(len, table.data(), src.data(), dest.data());
}

void dot_prod(std::size_t len, std::span<const gf_t> coefficients,
              std::span<const ConstBlock> sources, MutableBlock dest,
              const Kernels& kernels) {
    if (coefficients.size() != sources.size()) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            std::to_string(coefficients.size()) + " coefficients for " +
            std::to_string(sources.size()) + " sources");
    }
    detail::check_block_lengths(len, sources, "source");
    if (dest.size() != len) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "destination holds " + std::to_string(dest.size()) + " bytes, expected " +
            std::to_string(len));
    }
    if (len == 0) {
        return;
    }

    auto tables = EncodeTables::build(
        Matrix(1, coefficients.size(),
               std::vector<gf_t>(coefficients.begin(), coefficients.end())));
    std::vector<const std::uint8_t*> ptrs(sources.size());
    for (std::size_t i = 0; i < sources.size(); i++) {
        ptrs[i] = sources[i].data();
    }
    kernels.dot_prod(len, sources.size(), tables.row(0), ptrs.data(), dest.data());
}

void mad(std::size_t len, gf_t c, ConstBlock src, MutableBlock dest,
         const Kernels& kernels) {
    if (src.size() != len || dest.size() != len) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "mad buffers must hold exactly " + std::to_string(len) + " bytes");
    }
    if (len == 0) {
        return;
    }

    std::array<std::uint8_t, GF_TABLE_SIZE> table;
    init_mul_table(c, table);
    kernels.mad(len, table.data(), src.data(), dest.data());
}

}  // namespace rsec
