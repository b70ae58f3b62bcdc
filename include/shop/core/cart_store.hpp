#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "cart.hpp"
#include "cart_error.hpp"
#include "decimal.hpp"
#include "shop/utils/expected.hpp"

namespace shop {
namespace core {

// In-memory store of all carts, keyed by cart id.
//
// Carts are created lazily by the first successful addItem for an id and are
// never removed. The cart map is guarded by a shared mutex that is only held
// for lookup and insertion; merging and summing run under the per-cart lock,
// so operations on different carts do not serialize on each other.
class CartStore {
  public:
    CartStore() = default;
    ~CartStore() = default;

    CartStore(const CartStore&) = delete;
    CartStore& operator=(const CartStore&) = delete;

    // Adds quantity units of item_name to the cart, creating cart and line as
    // needed. Returns the updated cart total.
    // INVALID_ARGUMENT: price < 0 or quantity <= 0 (store left unchanged)
    // AMOUNT_OVERFLOW: merged quantity or total out of range (store left unchanged)
    [[nodiscard]] utils::Expected<Decimal, CartError> addItem(const std::string& cart_id,
                                                              const std::string& item_name,
                                                              const Decimal& price,
                                                              std::int64_t quantity);

    // NOT_FOUND if no addItem ever succeeded for cart_id
    [[nodiscard]] utils::Expected<Decimal, CartError> getTotal(const std::string& cart_id) const;

    // Value snapshot of the cart lines, sorted by item name
    [[nodiscard]] utils::Expected<std::vector<CartItemSnapshot>, CartError> getItems(
        const std::string& cart_id) const;

    [[nodiscard]] bool contains(const std::string& cart_id) const;
    [[nodiscard]] std::size_t cartCount() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Cart>> carts_;

    std::shared_ptr<Cart> findCart(const std::string& cart_id) const;
    std::shared_ptr<Cart> findOrCreateCart(const std::string& cart_id);
};

}  // namespace core
}  // namespace shop
