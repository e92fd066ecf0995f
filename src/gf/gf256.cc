#include "gf/gf256.hh"
#include "core/error.hh"
#include "core/logging.hh"

namespace rsec {

const GF256::Tables& GF256::tables() {
    static const Tables t = [] {
        Tables built{};

        // 2 is a generator of the multiplicative group under 0x11d
        std::uint16_t x = 1;
        for (int i = 0; i < 255; i++) {
            built.exp[i] = static_cast<std::uint8_t>(x);
            built.log[x] = static_cast<std::uint8_t>(i);

            x <<= 1;
            if (x & 0x100) {
                x ^= GF_POLYNOMIAL;
            }
        }

        // Doubled exp table: log(a) + log(b) never needs a modulo
        for (int i = 255; i < 512; i++) {
            built.exp[i] = built.exp[i - 255];
        }

        built.log[0] = 0;  // Convention, never read for a == 0
        rsec::log::gf.debug("GF(2^8) log/exp tables built");
        return built;
    }();
    return t;
}

gf_t GF256::mul(gf_t a, gf_t b) {
    if (a == 0 || b == 0) return 0;
    const auto& t = tables();
    return t.exp[t.log[a] + t.log[b]];
}

gf_t GF256::div(gf_t a, gf_t b) {
    if (b == 0) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "GF(2^8) division by zero");
    }
    if (a == 0) return 0;
    const auto& t = tables();
    return t.exp[t.log[a] + 255 - t.log[b]];
}

gf_t GF256::inv(gf_t a) {
    if (a == 0) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "GF(2^8) zero has no inverse");
    }
    const auto& t = tables();
    return t.exp[255 - t.log[a]];
}

gf_t GF256::pow(gf_t a, unsigned n) {
    if (n == 0) return 1;
    if (a == 0) return 0;
    const auto& t = tables();
    return t.exp[(static_cast<unsigned>(t.log[a]) * (n % 255)) % 255];
}

gf_t GF256::mul_slow(gf_t a, gf_t b) {
    std::uint16_t acc = 0;
    std::uint16_t aa = a;
    for (int bit = 0; bit < 8; ++bit) {
        if (b & (1u << bit)) {
            acc ^= static_cast<std::uint16_t>(aa << bit);
        }
    }
    for (int bit = 14; bit >= 8; --bit) {
        if (acc & (1u << bit)) {
            acc ^= static_cast<std::uint16_t>(GF_POLYNOMIAL << (bit - 8));
        }
    }
    return static_cast<gf_t>(acc);
}

std::uint8_t GF256::log(gf_t a) {
    return tables().log[a];
}

gf_t GF256::exp(unsigned n) {
    return tables().exp[n % 255];
}

}  // namespace rsec
