#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "shop/core/cart_store.hpp"

using namespace shop::core;

class CartStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        store_ = std::make_unique<CartStore>();
    }

    static Decimal price(const char* text) {
        return Decimal::parse(text);
    }

    std::unique_ptr<CartStore> store_;
};

TEST_F(CartStoreTest, InitialState) {
    EXPECT_EQ(store_->cartCount(), 0u);
    EXPECT_FALSE(store_->contains("c1"));
}

TEST_F(CartStoreTest, AddItemCreatesCartAndReturnsTotal) {
    auto result = store_->addItem("c1", "Book", price("120.50"), 2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().toString(), "241.00");

    EXPECT_TRUE(store_->contains("c1"));
    EXPECT_EQ(store_->cartCount(), 1u);

    auto total = store_->getTotal("c1");
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(total->toString(), "241.00");
}

TEST_F(CartStoreTest, SameItemMergesAtFirstPrice) {
    ASSERT_TRUE(store_->addItem("c1", "Book", price("120.50"), 2).has_value());

    auto result = store_->addItem("c1", "Book", price("120.50"), 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->toString(), "602.50");

    auto items = store_->getItems("c1");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 1u);
    EXPECT_EQ((*items)[0].name, "Book");
    EXPECT_EQ((*items)[0].quantity, 5);

    // A different price for an existing line is ignored
    result = store_->addItem("c1", "Book", price("1.00"), 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->toString(), "723.00");
}

TEST_F(CartStoreTest, UnknownCartIsNotFound) {
    auto total = store_->getTotal("missing");
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error(), CartError::NOT_FOUND);

    auto items = store_->getItems("missing");
    ASSERT_FALSE(items.has_value());
    EXPECT_EQ(items.error(), CartError::NOT_FOUND);

    // Reads never create carts
    EXPECT_FALSE(store_->contains("missing"));
    EXPECT_EQ(store_->cartCount(), 0u);
}

TEST_F(CartStoreTest, InvalidArgumentsLeaveStoreUnchanged) {
    auto negative = store_->addItem("c1", "Book", price("-1.00"), 1);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error(), CartError::INVALID_ARGUMENT);

    auto zero_qty = store_->addItem("c1", "Book", price("1.00"), 0);
    ASSERT_FALSE(zero_qty.has_value());
    EXPECT_EQ(zero_qty.error(), CartError::INVALID_ARGUMENT);

    auto negative_qty = store_->addItem("c1", "Book", price("1.00"), -2);
    ASSERT_FALSE(negative_qty.has_value());
    EXPECT_EQ(negative_qty.error(), CartError::INVALID_ARGUMENT);

    EXPECT_FALSE(store_->contains("c1"));
    EXPECT_EQ(store_->cartCount(), 0u);
}

TEST_F(CartStoreTest, InvalidArgumentsOnExistingCartKeepTotal) {
    ASSERT_TRUE(store_->addItem("c1", "Book", price("120.50"), 2).has_value());

    auto result = store_->addItem("c1", "Book", price("120.50"), 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CartError::INVALID_ARGUMENT);

    EXPECT_EQ(store_->getTotal("c1")->toString(), "241.00");
    EXPECT_EQ((*store_->getItems("c1"))[0].quantity, 2);
}

TEST_F(CartStoreTest, ZeroPriceIsAccepted) {
    auto result = store_->addItem("c1", "Sample", price("0.00"), 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isZero());
    EXPECT_TRUE(store_->contains("c1"));
}

TEST_F(CartStoreTest, AmountOverflowIsReportedWithoutSideEffects) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();

    auto line = store_->addItem("c1", "Gold", Decimal::fromUnscaled(max, 0), 2);
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error(), CartError::AMOUNT_OVERFLOW);
    EXPECT_FALSE(store_->contains("c1"));

    ASSERT_TRUE(store_->addItem("c2", "Gold", Decimal::fromUnscaled(max, 0), 1).has_value());
    auto total = store_->addItem("c2", "Silver", price("1"), 1);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error(), CartError::AMOUNT_OVERFLOW);
    EXPECT_EQ(store_->getItems("c2")->size(), 1u);
    EXPECT_EQ(*store_->getTotal("c2"), Decimal::fromUnscaled(max, 0));
}

TEST_F(CartStoreTest, MergeIgnoresOverflowingSuppliedPrice) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    ASSERT_TRUE(store_->addItem("c1", "Book", price("1.00"), 1).has_value());

    // Only the existing 1.00 price counts for the merged units
    auto result = store_->addItem("c1", "Book", Decimal::fromUnscaled(max, 2), 2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->toString(), "3.00");

    auto items = store_->getItems("c1");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 1u);
    EXPECT_EQ((*items)[0].quantity, 3);
    EXPECT_EQ((*items)[0].unit_price.toString(), "1.00");
}

TEST_F(CartStoreTest, OverflowingNewLineInExistingCartIsRejected) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    ASSERT_TRUE(store_->addItem("c1", "Book", price("1.00"), 1).has_value());

    auto result = store_->addItem("c1", "Gold", Decimal::fromUnscaled(max, 0), 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CartError::AMOUNT_OVERFLOW);
    EXPECT_EQ(store_->getItems("c1")->size(), 1u);
    EXPECT_EQ(store_->getTotal("c1")->toString(), "1.00");
}

TEST_F(CartStoreTest, ReadsAreIdempotent) {
    ASSERT_TRUE(store_->addItem("c1", "Book", price("120.50"), 2).has_value());
    ASSERT_TRUE(store_->addItem("c1", "Pen", price("1.25"), 4).has_value());

    auto first = store_->getTotal("c1");
    auto second = store_->getTotal("c1");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(first->toString(), "246.00");
    EXPECT_EQ(store_->getItems("c1")->size(), 2u);
}

TEST_F(CartStoreTest, CartsAreIndependent) {
    ASSERT_TRUE(store_->addItem("c1", "Book", price("10.00"), 1).has_value());
    ASSERT_TRUE(store_->addItem("c2", "Book", price("99.99"), 2).has_value());

    EXPECT_EQ(store_->getTotal("c1")->toString(), "10.00");
    EXPECT_EQ(store_->getTotal("c2")->toString(), "199.98");
    EXPECT_EQ(store_->cartCount(), 2u);
}

TEST_F(CartStoreTest, RepeatedSmallAmountsStayExact) {
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(store_->addItem("c1", "Sticker-" + std::to_string(i), price("0.10"), 1)
                        .has_value());
    }
    EXPECT_EQ(store_->getTotal("c1")->toString(), "100.00");
}

TEST_F(CartStoreTest, ConcurrentAddsOfSameItemAreNotLost) {
    const int num_threads = 8;
    const int adds_per_thread = 250;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, &failures]() {
            for (int i = 0; i < adds_per_thread; ++i) {
                if (!store_->addItem("shared", "Book", price("1.50"), 1).has_value()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    auto items = store_->getItems("shared");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 1u);
    EXPECT_EQ((*items)[0].quantity, num_threads * adds_per_thread);
    EXPECT_EQ(store_->getTotal("shared")->toString(), "3000.00");
}

TEST_F(CartStoreTest, ConcurrentFirstAccessCreatesOneCart) {
    const int num_threads = 16;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            (void)store_->addItem("fresh", "Item-" + std::to_string(t), price("2.00"), 1);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store_->cartCount(), 1u);
    EXPECT_EQ(store_->getItems("fresh")->size(), static_cast<std::size_t>(num_threads));
    EXPECT_EQ(store_->getTotal("fresh")->toString(), "32.00");
}

TEST_F(CartStoreTest, ConcurrentAddsToDifferentCarts) {
    const int num_threads = 8;
    const int adds_per_thread = 100;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            std::string cart_id = "cart-" + std::to_string(t);
            for (int i = 0; i < adds_per_thread; ++i) {
                (void)store_->addItem(cart_id, "Pen", price("0.25"), 1);
                (void)store_->getTotal(cart_id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store_->cartCount(), static_cast<std::size_t>(num_threads));
    for (int t = 0; t < num_threads; ++t) {
        EXPECT_EQ(store_->getTotal("cart-" + std::to_string(t))->toString(), "25.00");
    }
}

TEST_F(CartStoreTest, TotalsObservedDuringWritesAreMonotonic) {
    std::atomic<bool> done{false};
    std::atomic<bool> regressed{false};
    ASSERT_TRUE(store_->addItem("c1", "Pen", price("0.50"), 1).has_value());

    std::thread reader([this, &done, &regressed]() {
        Decimal last = Decimal::zero();
        while (!done.load()) {
            auto total = store_->getTotal("c1");
            if (total.has_value()) {
                if (*total < last) {
                    regressed = true;
                }
                last = *total;
            }
        }
    });

    for (int i = 0; i < 500; ++i) {
        (void)store_->addItem("c1", "Pen", price("0.50"), 1);
    }
    done = true;
    reader.join();

    EXPECT_FALSE(regressed.load());
    EXPECT_EQ(store_->getTotal("c1")->toString(), "250.50");
}
