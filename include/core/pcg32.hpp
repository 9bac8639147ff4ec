/**
 * @file pcg32.hpp
 * @brief Seeded PCG-XSH-RR generator. The only source of randomness in the game.
 */

#pragma once

#include <cstdint>

namespace core {

/**
 * @class Pcg32
 * @brief 32-bit PCG generator with selectable stream.
 *
 * Output is identical across platforms and standard libraries, which
 * std::uniform_int_distribution does not guarantee.
 */
class Pcg32 {
public:
    Pcg32() { seed(0, 0); }
    Pcg32(uint64_t initstate, uint64_t initseq) { seed(initstate, initseq); }

    void seed(uint64_t initstate, uint64_t initseq);

    uint32_t next();

    /**
     * @brief Uniform integer in [0, n). Returns 0 when n == 0.
     */
    uint32_t uniform(uint32_t n);

    /**
     * @brief Uniform integer in [lo, hi], inclusive. Returns lo when hi <= lo.
     */
    uint32_t range(uint32_t lo, uint32_t hi);

    uint64_t state() const { return state_; }
    uint64_t increment() const { return inc_; }

private:
    uint64_t state_ = 0;
    uint64_t inc_ = 1;  // must be odd
};

}
