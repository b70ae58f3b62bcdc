#include "shop/core/cart_store.hpp"

#include <mutex>
#include <stdexcept>

namespace shop {
namespace core {

utils::Expected<Decimal, CartError> CartStore::addItem(const std::string& cart_id,
                                                       const std::string& item_name,
                                                       const Decimal& price,
                                                       std::int64_t quantity) {
    if (price.isNegative() || quantity <= 0) {
        return CartError::INVALID_ARGUMENT;
    }

    auto cart = findCart(cart_id);
    if (!cart) {
        // A first line whose own subtotal overflows can never be added; do not
        // register a cart for it. Existing carts check in Cart::addItem, where
        // the supplied price is ignored for lines that already exist.
        try {
            (void)(price * quantity);
        } catch (const std::overflow_error&) {
            return CartError::AMOUNT_OVERFLOW;
        }
        cart = findOrCreateCart(cart_id);
    }

    try {
        return cart->addItem(item_name, price, quantity);
    } catch (const std::overflow_error&) {
        return CartError::AMOUNT_OVERFLOW;
    } catch (const std::invalid_argument&) {
        return CartError::INVALID_ARGUMENT;
    }
}

utils::Expected<Decimal, CartError> CartStore::getTotal(const std::string& cart_id) const {
    auto cart = findCart(cart_id);
    if (!cart) {
        return CartError::NOT_FOUND;
    }
    return cart->total();
}

utils::Expected<std::vector<CartItemSnapshot>, CartError> CartStore::getItems(
    const std::string& cart_id) const {
    auto cart = findCart(cart_id);
    if (!cart) {
        return CartError::NOT_FOUND;
    }
    return cart->getItems();
}

bool CartStore::contains(const std::string& cart_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return carts_.contains(cart_id);
}

std::size_t CartStore::cartCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return carts_.size();
}

std::shared_ptr<Cart> CartStore::findCart(const std::string& cart_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = carts_.find(cart_id);
    return (it != carts_.end()) ? it->second : nullptr;
}

std::shared_ptr<Cart> CartStore::findOrCreateCart(const std::string& cart_id) {
    if (auto cart = findCart(cart_id)) {
        return cart;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another caller may have created it between the two locks
    auto it = carts_.find(cart_id);
    if (it != carts_.end()) {
        return it->second;
    }

    auto cart = std::make_shared<Cart>(cart_id);
    carts_.emplace(cart_id, cart);
    return cart;
}

}  // namespace core
}  // namespace shop
