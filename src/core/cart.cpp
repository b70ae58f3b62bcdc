#include "shop/core/cart.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace shop {
namespace core {

Cart::Cart(std::string cart_id) : cart_id_(std::move(cart_id)) {
}

Decimal Cart::addItem(const std::string& item_name, const Decimal& unit_price,
                      std::int64_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(item_name);
    if (it == items_.end()) {
        CartItem item(item_name, unit_price, quantity);

        // Check the resulting total before the line becomes visible
        Decimal new_total = totalLocked() + item.subtotal();
        items_.emplace(item_name, std::move(item));
        return new_total;
    }

    CartItem& existing = it->second;
    if (quantity <= 0) {
        return totalLocked();
    }
    if (existing.getQuantity() > std::numeric_limits<std::int64_t>::max() - quantity) {
        throw std::overflow_error("Quantity overflow for item: " + item_name);
    }

    // Existing price is authoritative; the supplied one is ignored on merge
    Decimal new_total = totalLocked() + existing.getUnitPrice() * quantity;
    existing.addQuantity(quantity);
    return new_total;
}

Decimal Cart::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalLocked();
}

std::size_t Cart::itemCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::optional<CartItemSnapshot> Cart::findItem(const std::string& item_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(item_name);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return snapshotOf(it->second);
}

std::vector<CartItemSnapshot> Cart::getItems() const {
    std::vector<CartItemSnapshot> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(items_.size());
        for (const auto& [name, item] : items_) {
            snapshot.push_back(snapshotOf(item));
        }
    }

    std::sort(snapshot.begin(), snapshot.end(),
              [](const CartItemSnapshot& a, const CartItemSnapshot& b) { return a.name < b.name; });
    return snapshot;
}

Decimal Cart::totalLocked() const {
    Decimal sum = Decimal::zero();
    for (const auto& [name, item] : items_) {
        sum += item.subtotal();
    }
    return sum;
}

CartItemSnapshot Cart::snapshotOf(const CartItem& item) {
    CartItemSnapshot snapshot;
    snapshot.name = item.getName();
    snapshot.unit_price = item.getUnitPrice();
    snapshot.quantity = item.getQuantity();
    snapshot.subtotal = item.subtotal();
    return snapshot;
}

}  // namespace core
}  // namespace shop
