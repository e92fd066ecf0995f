#pragma once

#include "core/types.hh"
#include "gf/dispatch.hh"
#include "gf/matrix.hh"
#include <span>
#include <vector>

namespace rsec {

// ============================================================================
// Recovery Engine
// ============================================================================

// How a set of erasures is rebuilt: erased block e equals
// XOR_i coefficients[e][i] * block[survivors[i]].
struct DecodePlan {
    std::vector<block_index_t> survivors;  // k ascending indices not erased
    Matrix coefficients;                   // |erasures| x k, rows in erasure order
};

// Throws ErasureError:
//   INVALID_PARAMETERS  index >= k + p or repeated
//   UNRECOVERABLE_LOSS  more than p indices
void validate_erasures(std::size_t k, std::size_t p, std::span<const block_index_t> erasures);

// Builds the recovery coefficients for a (k + p) x k generator.
// Takes the first k surviving rows, inverts them, and for erased parity
// rows folds the generator row back in. Throws SINGULAR_SUBMATRIX when the
// survivor rows do not invert.
[[nodiscard]] DecodePlan decode_matrix(const Matrix& generator,
                                       std::span<const block_index_t> erasures);

// Rebuilds every erased block.
//   blocks         k + p entries in codeword order; erased entries are not read
//                  and may be empty, the rest must hold at least len bytes
//   reconstructed  one buffer per erasure, in erasure order
// Nothing is written unless validation and inversion succeed.
void decode(const Matrix& generator,
            std::size_t len,
            std::span<const block_index_t> erasures,
            std::span<const ConstBlock> blocks,
            std::span<const MutableBlock> reconstructed,
            const Kernels& kernels = active_kernels());

}  // namespace rsec
