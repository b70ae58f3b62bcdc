#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cart_item.hpp"
#include "decimal.hpp"

namespace shop {
namespace core {

// A single cart: item name -> CartItem, guarded by the cart's own mutex.
// Every read and write of the item map happens under that mutex, so each
// item is always observed with a consistent price/quantity pair.
class Cart {
  public:
    explicit Cart(std::string cart_id);
    ~Cart() = default;

    Cart(const Cart&) = delete;
    Cart& operator=(const Cart&) = delete;
    Cart(Cart&&) = delete;
    Cart& operator=(Cart&&) = delete;

    [[nodiscard]] const std::string& getId() const noexcept {
        return cart_id_;
    }

    // Inserts a new line or merges the quantity into the existing one. The price
    // of an existing line is kept. Returns the cart total including this add.
    // Throws std::invalid_argument for an invalid new line and std::overflow_error
    // if the merged quantity or the total would overflow; either way nothing changes.
    Decimal addItem(const std::string& item_name, const Decimal& unit_price,
                    std::int64_t quantity);

    [[nodiscard]] Decimal total() const;
    [[nodiscard]] std::size_t itemCount() const;
    [[nodiscard]] std::optional<CartItemSnapshot> findItem(const std::string& item_name) const;

    // Lines sorted by item name
    [[nodiscard]] std::vector<CartItemSnapshot> getItems() const;

  private:
    std::string cart_id_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CartItem> items_;

    Decimal totalLocked() const;
    static CartItemSnapshot snapshotOf(const CartItem& item);
};

}  // namespace core
}  // namespace shop
