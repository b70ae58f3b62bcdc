#include "shop/core/cart_item.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace shop {
namespace core {

CartItem::CartItem(std::string name, Decimal unit_price, std::int64_t quantity)
    : name_(std::move(name)), unit_price_(unit_price), quantity_(quantity) {
    if (unit_price_.isNegative()) {
        throw std::invalid_argument("Price must be non-negative");
    }
    if (quantity_ <= 0) {
        throw std::invalid_argument("Quantity must be greater than zero");
    }
}

void CartItem::addQuantity(std::int64_t amount) {
    if (amount <= 0) {
        return;
    }
    if (quantity_ > std::numeric_limits<std::int64_t>::max() - amount) {
        throw std::overflow_error("Quantity overflow for item: " + name_);
    }
    quantity_ += amount;
}

Decimal CartItem::subtotal() const {
    return unit_price_ * quantity_;
}

}  // namespace core
}  // namespace shop
