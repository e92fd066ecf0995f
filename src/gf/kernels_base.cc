#include "gf/kernels.hh"
#include "gf/tables.hh"
#include "core/types.hh"

namespace rsec::detail {

void dot_prod_range(std::size_t begin, std::size_t end, std::size_t vec,
                    const std::uint8_t* tables, const std::uint8_t* const* src,
                    std::uint8_t* dest) {
    for (std::size_t o = begin; o < end; o++) {
        std::uint8_t acc = 0;
        for (std::size_t i = 0; i < vec; i++) {
            acc ^= table_mul(tables + i * GF_TABLE_SIZE, src[i][o]);
        }
        dest[o] = acc;
    }
}

void mad_range(std::size_t begin, std::size_t end, const std::uint8_t* table,
               const std::uint8_t* src, std::uint8_t* dest) {
    for (std::size_t o = begin; o < end; o++) {
        dest[o] ^= table_mul(table, src[o]);
    }
}

void vect_mul_range(std::size_t begin, std::size_t end, const std::uint8_t* table,
                    const std::uint8_t* src, std::uint8_t* dest) {
    for (std::size_t o = begin; o < end; o++) {
        dest[o] = table_mul(table, src[o]);
    }
}

void base_dot_prod(std::size_t len, std::size_t vec, const std::uint8_t* tables,
                   const std::uint8_t* const* src, std::uint8_t* dest) {
    dot_prod_range(0, len, vec, tables, src, dest);
}

void base_mad(std::size_t len, const std::uint8_t* table,
              const std::uint8_t* src, std::uint8_t* dest) {
    mad_range(0, len, table, src, dest);
}

void base_vect_mul(std::size_t len, const std::uint8_t* table,
                   const std::uint8_t* src, std::uint8_t* dest) {
    vect_mul_range(0, len, table, src, dest);
}

}  // namespace rsec::detail
