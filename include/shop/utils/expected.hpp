#pragma once

#include <utility>
#include <variant>

namespace shop::utils {

// Minimal expected-like type built on std::variant.
// Holds either a success value of type T or an error of type E.
template <typename T, typename E>
class Expected {
  private:
    std::variant<T, E> data_;

  public:
    Expected(const T& value) : data_(std::in_place_index<0>, value) {
    }
    Expected(T&& value) : data_(std::in_place_index<0>, std::move(value)) {
    }
    Expected(const E& error) : data_(std::in_place_index<1>, error) {
    }
    Expected(E&& error) : data_(std::in_place_index<1>, std::move(error)) {
    }

    bool has_value() const noexcept {
        return data_.index() == 0;
    }
    explicit operator bool() const noexcept {
        return has_value();
    }

    const T& value() const& {
        return std::get<0>(data_);
    }
    T& value() & {
        return std::get<0>(data_);
    }
    T&& value() && {
        return std::get<0>(std::move(data_));
    }

    template <typename U>
    T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

    const T& operator*() const& {
        return std::get<0>(data_);
    }
    T& operator*() & {
        return std::get<0>(data_);
    }
    T&& operator*() && {
        return std::get<0>(std::move(data_));
    }

    const T* operator->() const {
        return &std::get<0>(data_);
    }
    T* operator->() {
        return &std::get<0>(data_);
    }

    const E& error() const& {
        return std::get<1>(data_);
    }
    E& error() & {
        return std::get<1>(data_);
    }
    E&& error() && {
        return std::get<1>(std::move(data_));
    }
};

// Specialization for void success type
template <typename E>
class Expected<void, E> {
  private:
    std::variant<std::monostate, E> data_;

  public:
    Expected() : data_(std::monostate{}) {
    }
    Expected(const E& error) : data_(error) {
    }
    Expected(E&& error) : data_(std::move(error)) {
    }

    bool has_value() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }
    explicit operator bool() const noexcept {
        return has_value();
    }

    const E& error() const& {
        return std::get<E>(data_);
    }
    E& error() & {
        return std::get<E>(data_);
    }
    E&& error() && {
        return std::get<E>(std::move(data_));
    }
};

}  // namespace shop::utils
