#pragma once

// Kernel entry points behind the dispatch table. Internal to the gf module.

#include <cstddef>
#include <cstdint>

namespace rsec::detail {

// Scalar loops over byte offsets [begin, end); also used for SIMD tails
void dot_prod_range(std::size_t begin, std::size_t end, std::size_t vec,
                    const std::uint8_t* tables, const std::uint8_t* const* src,
                    std::uint8_t* dest);
void mad_range(std::size_t begin, std::size_t end, const std::uint8_t* table,
               const std::uint8_t* src, std::uint8_t* dest);
void vect_mul_range(std::size_t begin, std::size_t end, const std::uint8_t* table,
                    const std::uint8_t* src, std::uint8_t* dest);

void base_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                   const std::uint8_t* const* src, std::uint8_t* dest);
void base_mad(std::size_t len, const std::uint8_t* table,
              const std::uint8_t* src, std::uint8_t* dest);
void base_vect_mul(std::size_t len, const std::uint8_t* table,
                   const std::uint8_t* src, std::uint8_t* dest);

#if defined(__x86_64__) || defined(__i386__)
#define RSEC_HAVE_X86_KERNELS 1

void ssse3_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                    const std::uint8_t* const* src, std::uint8_t* dest);
void ssse3_mad(std::size_t len, const std::uint8_t* table,
               const std::uint8_t* src, std::uint8_t* dest);
void ssse3_vect_mul(std::size_t len, const std::uint8_t* table,
                    const std::uint8_t* src, std::uint8_t* dest);

void avx2_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                   const std::uint8_t* const* src, std::uint8_t* dest);
void avx2_mad(std::size_t len, const std::uint8_t* table,
              const std::uint8_t* src, std::uint8_t* dest);
void avx2_vect_mul(std::size_t len, const std::uint8_t* table,
                   const std::uint8_t* src, std::uint8_t* dest);
#endif

}  // namespace rsec::detail
