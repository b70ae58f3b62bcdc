#pragma once

#include <cstdint>
#include <string>

#include "decimal.hpp"

namespace shop {
namespace core {

// One product line of a cart. Name and unit price are fixed at creation;
// only the quantity changes afterwards, and only upwards.
// Not synchronized: the owning Cart serializes all access.
class CartItem {
  public:
    // Throws std::invalid_argument if unit_price < 0 or quantity <= 0
    CartItem(std::string name, Decimal unit_price, std::int64_t quantity);
    ~CartItem() = default;

    [[nodiscard]] const std::string& getName() const noexcept {
        return name_;
    }
    [[nodiscard]] const Decimal& getUnitPrice() const noexcept {
        return unit_price_;
    }
    [[nodiscard]] std::int64_t getQuantity() const noexcept {
        return quantity_;
    }

    // Non-positive amounts are ignored. Throws std::overflow_error (quantity
    // unchanged) if the new quantity would not fit.
    void addQuantity(std::int64_t amount);

    // unit_price * quantity
    [[nodiscard]] Decimal subtotal() const;

  private:
    std::string name_;
    Decimal unit_price_;
    std::int64_t quantity_;
};

// Value copy of a CartItem taken under the cart lock
struct CartItemSnapshot {
    std::string name;
    Decimal unit_price;
    std::int64_t quantity{0};
    Decimal subtotal;
};

}  // namespace core
}  // namespace shop
