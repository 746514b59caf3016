#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Tagged error payload, produced by rc::error(e).
/// Makes "this is the error alternative" explicit, so result<int, int> can be constructed unambiguously.
template <class E>
struct rc::as_error_t
{
    E error;
};

namespace rc
{
namespace impl
{
template <class T>
inline constexpr bool is_as_error = false;
template <class E>
inline constexpr bool is_as_error<as_error_t<E>> = true;
} // namespace impl

/// Wraps an error value for construction of / return as a result.
/// Usage:
///   rc::result<int, std::string> parse(...)
///   {
///       if (bad)
///           return rc::error("unexpected token");
///       return 42;
///   }
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return as_error_t<std::decay_t<E>>{rc::forward<E>(e)};
}
} // namespace rc

/// Sum type holding either a success value T or an error value E.
/// Used for expected, recoverable failures (popping from an empty circular_array, out-of-range try_get, ...).
///
/// A default-constructed result holds a default-constructed error.
/// Trivially copyable (and destructible) when both T and E are.
/// Accessing the wrong alternative is a precondition violation (RC_ASSERT).
template <class T, class E>
struct rc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivially_destructible
        = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>;

    // construction
public:
    result()
        requires std::is_default_constructible_v<E>
      : _error(), _has_value(false)
    {
    }

    /// Success: constructs T from `value`.
    template <class U = std::remove_cv_t<T>>
        requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !impl::is_as_error<std::remove_cvref_t<U>>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _value(rc::forward<U>(value)), _has_value(true) // NOLINT
    {
    }

    /// Failure: constructs E from the tagged payload.
    template <class U>
        requires std::is_constructible_v<E, U&&>
    result(as_error_t<U>&& e) : _error(rc::move(e.error)), _has_value(false) // NOLINT
    {
    }

    template <class U>
        requires std::is_constructible_v<E, U const&>
    result(as_error_t<U> const& e) : _error(e.error), _has_value(false) // NOLINT
    {
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires is_trivially_copyable
    = default;
    result(result const&)
        requires is_trivially_copyable
    = default;
    result& operator=(result&&)
        requires is_trivially_copyable
    = default;
    result& operator=(result const&)
        requires is_trivially_copyable
    = default;

    ~result()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_value) T(rc::move(rhs._value));
        else
            new (rc::placement_new, &_error) E(rc::move(rhs._error));
    }

    result(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_value) T(rhs._value);
        else
            new (rc::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
            emplace_value(rc::move(rhs._value));
        else
            emplace_error(rc::move(rhs._error));
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
            emplace_value(rhs._value);
        else
            emplace_error(rhs._error);
        return *this;
    }

    ~result()
        requires(!is_trivially_destructible)
    {
        destroy_active();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// The success value, preserving the value category of the result.
    /// Precondition: has_value().
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        RC_ASSERT(self.has_value(), "attempted to access value of a result holding an error");
        return static_cast<Self&&>(self)._value;
    }

    /// The error value, preserving the value category of the result.
    /// Precondition: has_error().
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        RC_ASSERT(self.has_error(), "attempted to access error of a result holding a value");
        return static_cast<Self&&>(self)._error;
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _value : static_cast<T>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? rc::move(_value) : static_cast<T>(rc::forward<U>(fallback));
    }

    template <class U>
    [[nodiscard]] E error_or(U&& fallback) const&
    {
        return !_has_value ? _error : static_cast<E>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] E error_or(U&& fallback) &&
    {
        return !_has_value ? rc::move(_error) : static_cast<E>(rc::forward<U>(fallback));
    }

    // modifiers
public:
    /// Replaces the content with a value constructed from args.
    /// Arguments are fully constructed before the old content is destroyed, so they may alias it.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        T tmp(rc::forward<Args>(args)...);
        destroy_active();
        auto const p = new (rc::placement_new, &_value) T(rc::move(tmp));
        _has_value = true;
        return *p;
    }

    /// Replaces the content with an error constructed from args.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        E tmp(rc::forward<Args>(args)...);
        destroy_active();
        auto const p = new (rc::placement_new, &_error) E(rc::move(tmp));
        _has_value = false;
        return *p;
    }

private:
    void destroy_active()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _value.~T();
        }
        else
        {
            if constexpr (!std::is_trivially_destructible_v<E>)
                _error.~E();
        }
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };

    bool _has_value;
};
