/**
 * @file money.cpp
 * @brief Implements currency formatting.
 */

#include "core/money.hpp"

#include <cstdio>

namespace core {

std::string formatCents(Cents amount) {
    bool negative = amount < 0;
    uint64_t magnitude = negative ? static_cast<uint64_t>(-amount) : static_cast<uint64_t>(amount);

    std::string whole = std::to_string(magnitude / 100);
    // insert thousands separators from the right
    for (int pos = static_cast<int>(whole.size()) - 3; pos > 0; pos -= 3) {
        whole.insert(static_cast<size_t>(pos), ",");
    }

    char cents[4];
    std::snprintf(cents, sizeof(cents), "%02u", static_cast<unsigned>(magnitude % 100));

    return (negative ? "-$" : "$") + whole + "." + cents;
}

}
