#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "shop/core/decimal.hpp"
#include "shop/utils/expected.hpp"

namespace shop {
namespace validation {

enum class ValidationError {
    NONE,
    MISSING_PARAMETER,
    INVALID_CART_ID,
    INVALID_ITEM_NAME,
    INVALID_PRICE,
    INVALID_QUANTITY
};

struct ValidationResult {
    bool is_valid;
    ValidationError error;
    std::string error_message;
};

// Typed arguments for CartStore::addItem
struct AddItemRequest {
    std::string cart_id;
    std::string item_name;
    core::Decimal price;
    std::int64_t quantity{0};
};

// Syntactic checks on raw request parameters. Value rules that belong to the
// cart itself (price sign, quantity sign) are left to CartStore.
class CartRequestValidator {
  public:
    CartRequestValidator();
    ~CartRequestValidator() = default;

    ValidationResult validateCartId(std::string_view cart_id) const;
    ValidationResult validateItemName(std::string_view item_name) const;
    ValidationResult validatePrice(std::string_view price) const;
    ValidationResult validateQuantity(std::string_view quantity) const;

    // Reads cartId, itemName, price and quantity from params
    utils::Expected<AddItemRequest, ValidationResult> parseAddItemRequest(
        const std::map<std::string, std::string>& params) const;

    // Reads cartId from params
    utils::Expected<std::string, ValidationResult> parseCartId(
        const std::map<std::string, std::string>& params) const;

    void setMaxIdLength(std::size_t max_id_length);
    void setMaxQuantity(std::int64_t max_quantity);

    [[nodiscard]] std::size_t getMaxIdLength() const noexcept {
        return max_id_length_;
    }
    [[nodiscard]] std::int64_t getMaxQuantity() const noexcept {
        return max_quantity_;
    }

    // Parses an optionally signed base-10 integer that must fill the whole string
    static bool parseInteger(std::string_view text, std::int64_t& value);

  private:
    std::size_t max_id_length_;
    std::int64_t max_quantity_;

    static ValidationResult ok();
    static ValidationResult fail(ValidationError error, std::string message);
};

}  // namespace validation
}  // namespace shop

inline const char* validationErrorToString(shop::validation::ValidationError error) {
    switch (error) {
        case shop::validation::ValidationError::NONE:
            return "NONE";
        case shop::validation::ValidationError::MISSING_PARAMETER:
            return "MISSING_PARAMETER";
        case shop::validation::ValidationError::INVALID_CART_ID:
            return "INVALID_CART_ID";
        case shop::validation::ValidationError::INVALID_ITEM_NAME:
            return "INVALID_ITEM_NAME";
        case shop::validation::ValidationError::INVALID_PRICE:
            return "INVALID_PRICE";
        case shop::validation::ValidationError::INVALID_QUANTITY:
            return "INVALID_QUANTITY";
    }
    return "UNKNOWN";
}
