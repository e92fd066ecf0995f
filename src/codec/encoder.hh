#pragma once

#include "core/types.hh"
#include "gf/dispatch.hh"
#include "gf/tables.hh"
#include <span>
#include <string_view>

namespace rsec {

// ============================================================================
// Encoder
// ============================================================================

// All functions validate before writing anything and throw
// ErasureError(INVALID_PARAMETERS) on a bad argument. Every buffer must hold
// at least len bytes; only the first len bytes are read or written.
// len == 0 is a no-op after validation.

// coding[j][o] = XOR_i G[k + j][i] * data[i][o]
void encode(std::size_t len, std::size_t k, std::size_t p,
            const EncodeTables& tables,
            std::span<const ConstBlock> data,
            std::span<const MutableBlock> coding,
            const Kernels& kernels = active_kernels());

// Adds data block `source`'s contribution to every coding block. Starting
// from zeroed coding blocks and applying every source once equals encode().
void encode_update(std::size_t len, std::size_t k, std::size_t p, std::size_t source,
                   const EncodeTables& tables,
                   ConstBlock data,
                   std::span<const MutableBlock> coding,
                   const Kernels& kernels = active_kernels());

// dest[o] = c * src[o]
void vect_mul(std::size_t len, gf_t c, ConstBlock src, MutableBlock dest,
              const Kernels& kernels = active_kernels());

// dest[o] = XOR_i coefficients[i] * sources[i][o]
void dot_prod(std::size_t len, std::span<const gf_t> coefficients,
              std::span<const ConstBlock> sources, MutableBlock dest,
              const Kernels& kernels = active_kernels());

// dest[o] ^= c * src[o]
void mad(std::size_t len, gf_t c, ConstBlock src, MutableBlock dest,
         const Kernels& kernels = active_kernels());

namespace detail {

// Runs one dot product per table row: out[r] = tables.row(r) . sources
void apply_tables(std::size_t len, const EncodeTables& tables,
                  std::span<const std::uint8_t* const> sources,
                  std::span<std::uint8_t* const> outputs,
                  const Kernels& kernels);

// Throws unless every block holds at least len bytes
void check_block_lengths(std::size_t len, std::span<const ConstBlock> blocks,
                         std::string_view what);
void check_block_lengths(std::size_t len, std::span<const MutableBlock> blocks,
                         std::string_view what);

}  // namespace detail

}  // namespace rsec
