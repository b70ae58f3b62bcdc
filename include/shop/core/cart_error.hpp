#pragma once

#include <cstdint>

namespace shop::core {

enum class CartError : std::uint8_t {
    INVALID_ARGUMENT,  // negative price or non-positive quantity
    NOT_FOUND,         // no successful addItem ever happened for the cart id
    AMOUNT_OVERFLOW    // quantity or total no longer fits the decimal range
};

}  // namespace shop::core

inline const char* cartErrorToString(shop::core::CartError error) {
    switch (error) {
        case shop::core::CartError::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case shop::core::CartError::NOT_FOUND:
            return "NOT_FOUND";
        case shop::core::CartError::AMOUNT_OVERFLOW:
            return "AMOUNT_OVERFLOW";
    }
    return "UNKNOWN";
}
