#pragma once

#include "core/types.hh"
#include "gf/dispatch.hh"
#include "gf/matrix.hh"
#include "gf/tables.hh"
#include <optional>
#include <span>

namespace rsec {

// ============================================================================
// Codec Configuration
// ============================================================================

struct CodecConfig {
    std::size_t data_blocks = 0;                   // k
    std::size_t parity_blocks = 0;                 // p
    MatrixKind matrix = MatrixKind::CAUCHY;
    std::optional<SimdLevel> simd;                 // Clamped to what the CPU supports

    // Throws ErasureError(INVALID_PARAMETERS) for k == 0 or k + p > 256
    void validate() const;
};

// ============================================================================
// Erasure Codec
// ============================================================================

// Owns the generator matrix, its parity tables and the kernel family for one
// (k, p) geometry. Immutable after construction; one instance can serve any
// number of threads as long as each call works on its own buffers.
class ErasureCodec {
public:
    explicit ErasureCodec(const CodecConfig& config);

    // Caller-supplied generator. Must be (k + p) x k with an identity top;
    // it is not checked for the MDS property, so decode may report
    // SINGULAR_SUBMATRIX.
    explicit ErasureCodec(Matrix generator, std::optional<SimdLevel> simd = std::nullopt);

    [[nodiscard]] std::size_t data_blocks() const { return k_; }
    [[nodiscard]] std::size_t parity_blocks() const { return p_; }
    [[nodiscard]] std::size_t total_blocks() const { return k_ + p_; }

    [[nodiscard]] const Matrix& generator() const { return generator_; }
    [[nodiscard]] const EncodeTables& tables() const { return tables_; }
    [[nodiscard]] SimdLevel simd_level() const { return kernels_->level; }

    [[nodiscard]] bool can_recover(std::size_t erasure_count) const {
        return erasure_count <= p_;
    }

    // See encode() in codec/encoder.hh
    void encode(std::size_t len,
                std::span<const ConstBlock> data,
                std::span<const MutableBlock> coding) const;

    // See encode_update() in codec/encoder.hh
    void encode_update(std::size_t len, std::size_t source,
                       ConstBlock data,
                       std::span<const MutableBlock> coding) const;

    // See decode() in codec/decoder.hh
    void decode(std::size_t len,
                std::span<const block_index_t> erasures,
                std::span<const ConstBlock> blocks,
                std::span<const MutableBlock> reconstructed) const;

private:
    std::size_t k_;
    std::size_t p_;
    Matrix generator_;
    EncodeTables tables_;
    const Kernels* kernels_;

    void select_kernels(std::optional<SimdLevel> simd);
};

}  // namespace rsec
