#include "codec/codec.hh"
#include "codec/decoder.hh"
#include "codec/encoder.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <string>

namespace rsec {

// ============================================================================
// CodecConfig
// ============================================================================

void CodecConfig::validate() const {
    if (data_blocks == 0) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "data_blocks must be positive");
    }
    if (data_blocks > MAX_TOTAL_BLOCKS || parity_blocks > MAX_TOTAL_BLOCKS - data_blocks) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "data_blocks=" + std::to_string(data_blocks) + " parity_blocks=" +
            std::to_string(parity_blocks) + " exceeds " + std::to_string(MAX_TOTAL_BLOCKS));
    }
}

// ============================================================================
// ErasureCodec
// ============================================================================

ErasureCodec::ErasureCodec(const CodecConfig& config)
    : k_(config.data_blocks)
    , p_(config.parity_blocks)
    , kernels_(&active_kernels()) {
    config.validate();
    generator_ = generate(config.matrix, k_, p_);
    tables_ = build_tables(generator_, k_, p_);
    select_kernels(config.simd);

    RSEC_LOG_DEBUG(log::codec) << "Codec k=" << k_ << " p=" << p_
                               << " matrix=" << matrix_kind_name(config.matrix)
                               << " kernels=" << simd_level_name(kernels_->level);
}

ErasureCodec::ErasureCodec(Matrix generator, std::optional<SimdLevel> simd)
    : k_(generator.cols())
    , p_(generator.rows() >= generator.cols() ? generator.rows() - generator.cols() : 0)
    , generator_(std::move(generator))
    , kernels_(&active_kernels()) {
    if (k_ == 0 || generator_.rows() < k_ || k_ + p_ > MAX_TOTAL_BLOCKS) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "unusable generator shape " + std::to_string(generator_.rows()) + "x" +
            std::to_string(k_));
    }
    if (!generator_.is_systematic()) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "generator must start with a " + std::to_string(k_) + "x" +
            std::to_string(k_) + " identity");
    }
    tables_ = build_tables(generator_, k_, p_);
    select_kernels(simd);

    RSEC_LOG_DEBUG(log::codec) << "Codec k=" << k_ << " p=" << p_ << " matrix=custom"
                               << " kernels=" << simd_level_name(kernels_->level);
}

void ErasureCodec::select_kernels(std::optional<SimdLevel> simd) {
    if (!simd) {
        return;
    }
    kernels_ = &kernels_for(*simd);
    if (kernels_->level != *simd) {
        log::codec.warn() << "Requested " << simd_level_name(*simd)
                          << " kernels, CPU supports " << simd_level_name(kernels_->level);
    }
}

void ErasureCodec::encode(std::size_t len,
                          std::span<const ConstBlock> data,
                          std::span<const MutableBlock> coding) const {
    rsec::encode(len, k_, p_, tables_, data, coding, *kernels_);
}

void ErasureCodec::encode_update(std::size_t len, std::size_t source,
                                 ConstBlock data,
                                 std::span<const MutableBlock> coding) const {
    rsec::encode_update(len, k_, p_, source, tables_, data, coding, *kernels_);
}

void ErasureCodec::decode(std::size_t len,
                          std::span<const block_index_t> erasures,
                          std::span<const ConstBlock> blocks,
                          std::span<const MutableBlock> reconstructed) const {
    rsec::decode(generator_, len, erasures, blocks, reconstructed, *kernels_);
}

}  // namespace rsec
