#include "shop/core/decimal.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace shop {
namespace core {

namespace {
constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kInt64Min = std::numeric_limits<std::int64_t>::min();

constexpr std::int64_t POW10[Decimal::kMaxScale + 1] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
    1000000000LL,
    10000000000LL,
    100000000000LL,
    1000000000000LL,
    10000000000000LL,
    100000000000000LL,
    1000000000000000LL,
    10000000000000000LL,
    100000000000000000LL,
    1000000000000000000LL};

bool multiplyOverflows(std::int64_t a, std::int64_t b) noexcept {
    if (a == 0 || b == 0) {
        return false;
    }
    if (a > 0) {
        return b > 0 ? a > kInt64Max / b : b < kInt64Min / a;
    }
    return b > 0 ? a < kInt64Min / b : b < kInt64Max / a;
}

bool addOverflows(std::int64_t a, std::int64_t b) noexcept {
    return (b > 0 && a > kInt64Max - b) || (b < 0 && a < kInt64Min - b);
}

std::int64_t checkedMultiply(std::int64_t a, std::int64_t b) {
    if (multiplyOverflows(a, b)) {
        throw std::overflow_error("decimal multiplication overflow");
    }
    return a * b;
}

std::int64_t checkedAdd(std::int64_t a, std::int64_t b) {
    if (addOverflows(a, b)) {
        throw std::overflow_error("decimal addition overflow");
    }
    return a + b;
}

bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}
}  // namespace

Decimal Decimal::fromUnscaled(std::int64_t unscaled, int scale) {
    if (scale < 0 || scale > kMaxScale) {
        throw std::invalid_argument("decimal scale out of range: " + std::to_string(scale));
    }
    return Decimal(unscaled, scale);
}

Decimal Decimal::parse(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty decimal literal");
    }

    std::size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        ++pos;
    }

    std::int64_t unscaled = 0;
    int scale = 0;
    std::size_t digit_count = 0;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("malformed decimal literal: " + std::string(text));
            }
            seen_point = true;
            continue;
        }
        if (!isDigit(c)) {
            throw std::invalid_argument("malformed decimal literal: " + std::string(text));
        }
        if (seen_point && ++scale > kMaxScale) {
            throw std::invalid_argument("too many fractional digits: " + std::string(text));
        }
        // Accumulate on the negative side so the full int64 range stays reachable
        std::int64_t digit = c - '0';
        unscaled = checkedAdd(checkedMultiply(unscaled, 10), -digit);
        ++digit_count;
    }

    if (digit_count == 0) {
        throw std::invalid_argument("malformed decimal literal: " + std::string(text));
    }

    if (!negative) {
        if (unscaled == kInt64Min) {
            throw std::overflow_error("decimal literal out of range: " + std::string(text));
        }
        unscaled = -unscaled;
    }
    return Decimal(unscaled, scale);
}

Decimal Decimal::withScale(int new_scale) const {
    if (new_scale < scale_ || new_scale > kMaxScale) {
        throw std::invalid_argument("cannot rescale decimal from " + std::to_string(scale_) +
                                    " to " + std::to_string(new_scale));
    }
    return Decimal(checkedMultiply(unscaled_, POW10[new_scale - scale_]), new_scale);
}

Decimal Decimal::operator+(const Decimal& other) const {
    int common_scale = std::max(scale_, other.scale_);
    Decimal lhs = withScale(common_scale);
    Decimal rhs = other.withScale(common_scale);
    return Decimal(checkedAdd(lhs.unscaled_, rhs.unscaled_), common_scale);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal Decimal::operator*(std::int64_t multiplier) const {
    return Decimal(checkedMultiply(unscaled_, multiplier), scale_);
}

bool Decimal::operator==(const Decimal& other) const {
    return (*this <=> other) == std::strong_ordering::equal;
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const {
    if (signum() != other.signum()) {
        return signum() <=> other.signum();
    }
    if (scale_ == other.scale_) {
        return unscaled_ <=> other.unscaled_;
    }

    // Only the operand with the smaller scale is lifted. If that overflows,
    // its magnitude exceeds anything representable at the larger scale.
    const Decimal& narrow = scale_ < other.scale_ ? *this : other;
    const Decimal& wide = scale_ < other.scale_ ? other : *this;
    std::int64_t factor = POW10[wide.scale_ - narrow.scale_];

    std::strong_ordering narrow_vs_wide = std::strong_ordering::equal;
    if (multiplyOverflows(narrow.unscaled_, factor)) {
        narrow_vs_wide =
            narrow.isNegative() ? std::strong_ordering::less : std::strong_ordering::greater;
    } else {
        narrow_vs_wide = (narrow.unscaled_ * factor) <=> wide.unscaled_;
    }

    if (&narrow == this) {
        return narrow_vs_wide;
    }
    return 0 <=> narrow_vs_wide;
}

std::string Decimal::toString() const {
    std::uint64_t magnitude = unscaled_ < 0 ? 0 - static_cast<std::uint64_t>(unscaled_)
                                            : static_cast<std::uint64_t>(unscaled_);
    std::string digits = std::to_string(magnitude);

    if (scale_ > 0) {
        if (digits.size() <= static_cast<std::size_t>(scale_)) {
            digits.insert(0, static_cast<std::size_t>(scale_) + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<std::size_t>(scale_), 1, '.');
    }

    if (unscaled_ < 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

}  // namespace core
}  // namespace shop
