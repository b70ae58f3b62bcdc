#include "shop/validation/cart_request_validator.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

namespace shop {
namespace validation {

CartRequestValidator::CartRequestValidator() : max_id_length_(128), max_quantity_(1000000) {
}

ValidationResult CartRequestValidator::validateCartId(std::string_view cart_id) const {
    if (cart_id.empty()) {
        return fail(ValidationError::INVALID_CART_ID, "cartId must not be empty");
    }
    if (cart_id.size() > max_id_length_) {
        return fail(ValidationError::INVALID_CART_ID,
                    "cartId longer than " + std::to_string(max_id_length_) + " characters");
    }
    return ok();
}

ValidationResult CartRequestValidator::validateItemName(std::string_view item_name) const {
    if (item_name.empty()) {
        return fail(ValidationError::INVALID_ITEM_NAME, "itemName must not be empty");
    }
    if (item_name.size() > max_id_length_) {
        return fail(ValidationError::INVALID_ITEM_NAME,
                    "itemName longer than " + std::to_string(max_id_length_) + " characters");
    }
    return ok();
}

ValidationResult CartRequestValidator::validatePrice(std::string_view price) const {
    try {
        (void)core::Decimal::parse(price);
    } catch (const std::invalid_argument&) {
        return fail(ValidationError::INVALID_PRICE, "Invalid price: " + std::string(price));
    } catch (const std::overflow_error&) {
        return fail(ValidationError::INVALID_PRICE, "Price out of range: " + std::string(price));
    }
    return ok();
}

ValidationResult CartRequestValidator::validateQuantity(std::string_view quantity) const {
    std::int64_t value = 0;
    if (!parseInteger(quantity, value)) {
        return fail(ValidationError::INVALID_QUANTITY,
                    "Invalid quantity: " + std::string(quantity));
    }
    if (value > max_quantity_) {
        return fail(ValidationError::INVALID_QUANTITY,
                    "Quantity exceeds per-request limit of " + std::to_string(max_quantity_));
    }
    return ok();
}

utils::Expected<AddItemRequest, ValidationResult> CartRequestValidator::parseAddItemRequest(
    const std::map<std::string, std::string>& params) const {
    for (const char* name : {"cartId", "itemName", "price", "quantity"}) {
        if (params.find(name) == params.end()) {
            return fail(ValidationError::MISSING_PARAMETER,
                        std::string("Missing required parameter: ") + name);
        }
    }

    const std::string& cart_id = params.at("cartId");
    const std::string& item_name = params.at("itemName");
    const std::string& price = params.at("price");
    const std::string& quantity = params.at("quantity");

    for (ValidationResult result : {validateCartId(cart_id), validateItemName(item_name),
                                    validatePrice(price), validateQuantity(quantity)}) {
        if (!result.is_valid) {
            return result;
        }
    }

    AddItemRequest request;
    if (!parseInteger(quantity, request.quantity)) {
        return fail(ValidationError::INVALID_QUANTITY, "Invalid quantity: " + quantity);
    }
    request.cart_id = cart_id;
    request.item_name = item_name;
    request.price = core::Decimal::parse(price);
    return request;
}

utils::Expected<std::string, ValidationResult> CartRequestValidator::parseCartId(
    const std::map<std::string, std::string>& params) const {
    auto it = params.find("cartId");
    if (it == params.end()) {
        return fail(ValidationError::MISSING_PARAMETER, "Missing required parameter: cartId");
    }

    ValidationResult result = validateCartId(it->second);
    if (!result.is_valid) {
        return result;
    }
    return it->second;
}

void CartRequestValidator::setMaxIdLength(std::size_t max_id_length) {
    max_id_length_ = max_id_length;
}

void CartRequestValidator::setMaxQuantity(std::int64_t max_quantity) {
    max_quantity_ = max_quantity;
}

bool CartRequestValidator::parseInteger(std::string_view text, std::int64_t& value) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }

    std::int64_t parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return false;
    }
    value = parsed;
    return true;
}

ValidationResult CartRequestValidator::ok() {
    return ValidationResult{true, ValidationError::NONE, ""};
}

ValidationResult CartRequestValidator::fail(ValidationError error, std::string message) {
    return ValidationResult{false, error, std::move(message)};
}

}  // namespace validation
}  // namespace shop
