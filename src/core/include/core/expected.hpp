#pragma once

// Small expected<T,E> (subset of C++23 std::expected) for the exception-free
// entry points. Holds either a value or an error; no monadic ops.

#include <utility>
#include <variant>
#include <type_traits>

namespace em {

template <class E>
class unexpected {
public:
    static_assert(!std::is_reference_v<E>, "unexpected<E&> not supported");
    constexpr explicit unexpected(const E& e) : error_(e) {}
    constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}
    constexpr const E& error() const & noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
private:
    E error_;
};

template <class T, class E>
class expected {
public:
    static_assert(!std::is_reference_v<T>, "expected<T&> not supported");
    static_assert(!std::is_same_v<T, E>, "value and error types must differ");

    expected(const T& v) : data_(std::in_place_index<0>, v) {}
    expected(T&& v) : data_(std::in_place_index<0>, std::move(v)) {}
    expected(const unexpected<E>& ue) : data_(std::in_place_index<1>, ue.error()) {}
    expected(unexpected<E>&& ue) : data_(std::in_place_index<1>, std::move(ue.error())) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    // Only call when has_value() / !has_value() respectively
    const T& value() const & { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }
    const E& error() const & { return std::get<1>(data_); }

    const T& operator*() const & { return value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

template <class E>
unexpected<std::decay_t<E>> make_unexpected(E&& e) { return unexpected<std::decay_t<E>>(std::forward<E>(e)); }

} // namespace em
