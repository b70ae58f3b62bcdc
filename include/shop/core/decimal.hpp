#pragma once

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace shop {
namespace core {

// Exact fixed-point decimal amount: value = unscaled * 10^-scale.
// The scale is preserved through arithmetic, so "120.50" * 2 prints as "241.00".
// Arithmetic never rounds and never wraps; out-of-range results throw std::overflow_error.
class Decimal {
  public:
    static constexpr int kMaxScale = 18;

    constexpr Decimal() noexcept : unscaled_(0), scale_(0) {
    }

    [[nodiscard]] static Decimal zero() noexcept {
        return Decimal();
    }
    [[nodiscard]] static Decimal fromInteger(std::int64_t value) noexcept {
        return Decimal(value, 0);
    }
    // Throws std::invalid_argument if scale is outside [0, kMaxScale]
    [[nodiscard]] static Decimal fromUnscaled(std::int64_t unscaled, int scale);

    // Parses plain decimal notation: [+-]digits[.digits]
    // Throws std::invalid_argument for malformed text, std::overflow_error when out of range.
    [[nodiscard]] static Decimal parse(std::string_view text);

    [[nodiscard]] constexpr std::int64_t unscaled() const noexcept {
        return unscaled_;
    }
    [[nodiscard]] constexpr int scale() const noexcept {
        return scale_;
    }
    [[nodiscard]] constexpr int signum() const noexcept {
        return (unscaled_ > 0) - (unscaled_ < 0);
    }
    [[nodiscard]] constexpr bool isNegative() const noexcept {
        return unscaled_ < 0;
    }
    [[nodiscard]] constexpr bool isZero() const noexcept {
        return unscaled_ == 0;
    }

    // Same value expressed with more fractional digits. new_scale must not be smaller.
    [[nodiscard]] Decimal withScale(int new_scale) const;

    [[nodiscard]] Decimal operator+(const Decimal& other) const;
    Decimal& operator+=(const Decimal& other);
    [[nodiscard]] Decimal operator*(std::int64_t multiplier) const;

    // Numeric comparison: 1.5 == 1.50
    [[nodiscard]] bool operator==(const Decimal& other) const;
    [[nodiscard]] std::strong_ordering operator<=>(const Decimal& other) const;

    [[nodiscard]] std::string toString() const;

  private:
    constexpr Decimal(std::int64_t unscaled, int scale) noexcept
        : unscaled_(unscaled), scale_(scale) {
    }

    std::int64_t unscaled_;
    int scale_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

}  // namespace core
}  // namespace shop
