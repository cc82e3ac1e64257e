#pragma once

// Small expected<T,E> used by the compiler entry points so that a build failure
// carries a typed error instead of a bare string. Subset of std::expected (C++23):
// no monadic ops, no reference or void value types.

#include <utility>
#include <type_traits>
#include <new>

namespace tlc {

struct unexpect_t { explicit unexpect_t() = default; };
inline constexpr unexpect_t unexpect{};

template <class E>
class unexpected {
public:
    static_assert(!std::is_reference_v<E>, "unexpected<E&> not supported");
    constexpr explicit unexpected(const E& e) : error_(e) {}
    constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}
    constexpr const E& error() const & noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }
private:
    E error_;
};

template <class T, class E>
class expected {
public:
    static_assert(!std::is_reference_v<T>, "expected<T&> not supported");
    static_assert(!std::is_reference_v<E>, "expected<E&> not supported");

    expected(const T& v) : has_(true) { ::new (&storage_.value_) T(v); }
    expected(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>) : has_(true) { ::new (&storage_.value_) T(std::move(v)); }
    expected(const unexpected<E>& ue) : has_(false) { ::new (&storage_.error_) E(ue.error()); }
    expected(unexpected<E>&& ue) noexcept(std::is_nothrow_move_constructible_v<E>) : has_(false) { ::new (&storage_.error_) E(std::move(ue).error()); }
    expected(unexpect_t, const E& e) : has_(false) { ::new (&storage_.error_) E(e); }
    expected(unexpect_t, E&& e) noexcept(std::is_nothrow_move_constructible_v<E>) : has_(false) { ::new (&storage_.error_) E(std::move(e)); }

    expected(const expected& other) : has_(other.has_) {
        if(has_) ::new (&storage_.value_) T(other.storage_.value_);
        else ::new (&storage_.error_) E(other.storage_.error_);
    }
    expected(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>) : has_(other.has_) {
        if(has_) ::new (&storage_.value_) T(std::move(other.storage_.value_));
        else ::new (&storage_.error_) E(std::move(other.storage_.error_));
    }

    ~expected() { destroy(); }

    expected& operator=(const expected& rhs) {
        if(this == &rhs) return *this;
        expected tmp(rhs);
        destroy();
        has_ = tmp.has_;
        if(has_) ::new (&storage_.value_) T(std::move(tmp.storage_.value_));
        else ::new (&storage_.error_) E(std::move(tmp.storage_.error_));
        return *this;
    }
    expected& operator=(expected&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>) {
        if(this == &rhs) return *this;
        destroy();
        has_ = rhs.has_;
        if(has_) ::new (&storage_.value_) T(std::move(rhs.storage_.value_));
        else ::new (&storage_.error_) E(std::move(rhs.storage_.error_));
        return *this;
    }

    bool has_value() const noexcept { return has_; }
    explicit operator bool() const noexcept { return has_; }

    const T& value() const & { return storage_.value_; }
    T& value() & { return storage_.value_; }
    T&& value() && { return std::move(storage_.value_); }
    const T& operator*() const & { return storage_.value_; }
    T& operator*() & { return storage_.value_; }
    const T* operator->() const { return &storage_.value_; }
    T* operator->() { return &storage_.value_; }

    const E& error() const & { return storage_.error_; }
    E& error() & { return storage_.error_; }

private:
    union Storage { T value_; E error_; Storage(){} ~Storage(){} } storage_;
    bool has_{false};

    void destroy() noexcept {
        if(has_) storage_.value_.~T(); else storage_.error_.~E();
    }
};

template <class E>
unexpected<std::decay_t<E>> make_unexpected(E&& e) { return unexpected<std::decay_t<E>>(std::forward<E>(e)); }

} // namespace tlc
