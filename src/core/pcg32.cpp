/**
 * @file pcg32.cpp
 * @brief Implements the PCG32 generator.
 */

#include "core/pcg32.hpp"

namespace core {

void Pcg32::seed(uint64_t initstate, uint64_t initseq) {
    state_ = 0U;
    inc_ = (initseq << 1u) | 1u;
    next();
    state_ += initstate;
    next();
}

uint32_t Pcg32::next() {
    uint64_t oldstate = state_;
    state_ = oldstate * 6364136223846793005ULL + inc_;
    uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
    uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

uint32_t Pcg32::uniform(uint32_t n) {
    if (n == 0) return 0;
    // reject the low band so every residue is equally likely
    uint32_t threshold = (0u - n) % n;
    for (;;) {
        uint32_t r = next();
        if (r >= threshold) return r % n;
    }
}

uint32_t Pcg32::range(uint32_t lo, uint32_t hi) {
    if (hi <= lo) return lo;
    return lo + uniform(hi - lo + 1);
}

}
