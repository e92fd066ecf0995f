#include "gf/kernels.hh"
#include "core/types.hh"

#if defined(RSEC_HAVE_X86_KERNELS)

#include <immintrin.h>

// Each function carries its own target attribute so the file builds without
// -mssse3/-mavx2; dispatch only calls a family the CPU reported.

namespace rsec::detail {

// ============================================================================
// SSSE3: 16 bytes per step
// ============================================================================

namespace {

__attribute__((target("ssse3")))
inline __m128i mul16(__m128i x, __m128i lo_tbl, __m128i hi_tbl, __m128i mask) {
    __m128i lo = _mm_and_si128(x, mask);
    __m128i hi = _mm_and_si128(_mm_srli_epi64(x, 4), mask);
    return _mm_xor_si128(_mm_shuffle_epi8(lo_tbl, lo), _mm_shuffle_epi8(hi_tbl, hi));
}

__attribute__((target("ssse3")))
inline __m128i load_lo16(const std::uint8_t* table) {
    return _mm_loadu_si128(reinterpret_cast<const __m128i*>(table));
}

__attribute__((target("ssse3")))
inline __m128i load_hi16(const std::uint8_t* table) {
    return _mm_loadu_si128(reinterpret_cast<const __m128i*>(table + GF_TABLE_HALF));
}

}  // namespace

__attribute__((target("ssse3")))
void ssse3_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                    const std::uint8_t* const* src, std::uint8_t* dest) {
    const __m128i mask = _mm_set1_epi8(0x0f);
    std::size_t o = 0;
    for (; o + 16 <= len; o += 16) {
        __m128i acc = _mm_setzero_si128();
        for (std::size_t i = 0; i < vec; i++) {
            const std::uint8_t* t = tables + i * GF_TABLE_SIZE;
            __m128i x = _mm_loadu_si128(reinterpret_cast<const __m128i*>(src[i] + o));
            acc = _mm_xor_si128(acc, mul16(x, load_lo16(t), load_hi16(t), mask));
        }
        _mm_storeu_si128(reinterpret_cast<__m128i*>(dest + o), acc);
    }
    dot_prod_range(o, len, vec, tables, src, dest);
}

__attribute__((target("ssse3")))
void ssse3_mad(std::size_t len, const std::uint8_t* table,
               const std::uint8_t* src, std::uint8_t* dest) {
    const __m128i mask = _mm_set1_epi8(0x0f);
    const __m128i lo_tbl = load_lo16(table);
    const __m128i hi_tbl = load_hi16(table);
    std::size_t o = 0;
    for (; o + 16 <= len; o += 16) {
        __m128i x = _mm_loadu_si128(reinterpret_cast<const __m128i*>(src + o));
        __m128i d = _mm_loadu_si128(reinterpret_cast<const __m128i*>(dest + o));
        d = _mm_xor_si128(d, mul16(x, lo_tbl, hi_tbl, mask));
        _mm_storeu_si128(reinterpret_cast<__m128i*>(dest + o), d);
    }
    mad_range(o, len, table, src, dest);
}

__attribute__((target("ssse3")))
void ssse3_vect_mul(std::size_t len, const std::uint8_t* table,
                    const std::uint8_t* src, std::uint8_t* dest) {
    const __m128i mask = _mm_set1_epi8(0x0f);
    const __m128i lo_tbl = load_lo16(table);
    const __m128i hi_tbl = load_hi16(table);
    std::size_t o = 0;
    for (; o + 16 <= len; o += 16) {
        __m128i x = _mm_loadu_si128(reinterpret_cast<const __m128i*>(src + o));
        _mm_storeu_si128(reinterpret_cast<__m128i*>(dest + o), mul16(x, lo_tbl, hi_tbl, mask));
    }
    vect_mul_range(o, len, table, src, dest);
}

// ============================================================================
// AVX2: 32 bytes per step, 16-byte tables broadcast to both lanes
// ============================================================================

namespace {

__attribute__((target("avx2")))
inline __m256i mul32(__m256i x, __m256i lo_tbl, __m256i hi_tbl, __m256i mask) {
    __m256i lo = _mm256_and_si256(x, mask);
    __m256i hi = _mm256_and_si256(_mm256_srli_epi64(x, 4), mask);
    return _mm256_xor_si256(_mm256_shuffle_epi8(lo_tbl, lo), _mm256_shuffle_epi8(hi_tbl, hi));
}

__attribute__((target("avx2")))
inline __m256i load_lo32(const std::uint8_t* table) {
    return _mm256_broadcastsi128_si256(
        _mm_loadu_si128(reinterpret_cast<const __m128i*>(table)));
}

__attribute__((target("avx2")))
inline __m256i load_hi32(const std::uint8_t* table) {
    return _mm256_broadcastsi128_si256(
        _mm_loadu_si128(reinterpret_cast<const __m128i*>(table + GF_TABLE_HALF)));
}

}  // namespace

__attribute__((target("avx2")))
void avx2_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                   const std::uint8_t* const* src, std::uint8_t* dest) {
    const __m256i mask = _mm256_set1_epi8(0x0f);
    std::size_t o = 0;
    for (; o + 32 <= len; o += 32) {
        __m256i acc = _mm256_setzero_si256();
        for (std::size_t i = 0; i < vec; i++) {
            const std::uint8_t* t = tables + i * GF_TABLE_SIZE;
            __m256i x = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(src[i] + o));
            acc = _mm256_xor_si256(acc, mul32(x, load_lo32(t), load_hi32(t), mask));
        }
        _mm256_storeu_si256(reinterpret_cast<__m256i*>(dest + o), acc);
    }
    dot_prod_range(o, len, vec, tables, src, dest);
}

__attribute__((target("avx2")))
void avx2_mad(std::size_t len, const std::uint8_t* table,
              const std::uint8_t* src, std::uint8_t* dest) {
    const __m256i mask = _mm256_set1_epi8(0x0f);
    const __m256i lo_tbl = load_lo32(table);
    const __m256i hi_tbl = load_hi32(table);
    std::size_t o = 0;
    for (; o + 32 <= len; o += 32) {
        __m256i x = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(src + o));
        __m256i d = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(dest + o));
        d = _mm256_xor_si256(d, mul32(x, lo_tbl, hi_tbl, mask));
        _mm256_storeu_si256(reinterpret_cast<__m256i*>(dest + o), d);
    }
    mad_range(o, len, table, src, dest);
}

__attribute__((target("avx2")))
void avx2_vect_mul(std::size_t len, const std::uint8_t* table,
                   const std::uint8_t* src, std::uint8_t* dest) {
    const __m256i mask = _mm256_set1_epi8(0x0f);
    const __m256i lo_tbl = load_lo32(table);
    const __m256i hi_tbl = load_hi32(table);
    std::size_t o = 0;
    for (; o + 32 <= len; o += 32) {
        __m256i x = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(src + o));
        _mm256_storeu_si256(reinterpret_cast<__m256i*>(dest + o), mul32(x, lo_tbl, hi_tbl, mask));
    }
    vect_mul_range(o, len, table, src, dest);
}

}  // namespace rsec::detail

#endif  // RSEC_HAVE_X86_KERNELS
