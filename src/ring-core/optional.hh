#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of rc::optional.
/// Deliberately lacks a default constructor so that optional<T> = {} stays unambiguous.
struct rc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace rc
{
/// The canonical empty marker: optional<int> opt = rc::nullopt;
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace rc

/// Either a value of type T or nothing (T | none).
///
/// circular_array stores one optional<T> per slot: a vacated slot is nullopt, never an in-domain sentinel,
/// so every T (including null-like values such as nullptr or an empty string) is a legal element.
///
/// Smaller surface than std::optional: no operator* / operator->, equality only.
/// Trivially copyable when T is trivially copyable.
template <class T>
struct rc::optional
{
    // construction
public:
    /// Empty: has_value() == false.
    optional() = default;

    /// Holds `value`; explicit iff U is not implicitly convertible to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::forward<U>(value));
    }

    /// Empty, spelled explicitly.
    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Moves the value out of rhs and leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move-assigns or move-constructs from rhs; rhs keeps a moved-from value (like std::optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rc::move(rhs._storage.value);
            else
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));

            _has_value = true;
        }
        else
        {
            reset();
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (rc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else
            {
                reset();
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modifiers
public:
    /// Destroys the held value (if any) and constructs a new one in place.
    /// If T(args...) throws, the optional is left empty.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        auto const p = new (rc::placement_new, &_storage.value) T(rc::forward<Args>(args)...);
        _has_value = true; // _after_ so a throwing T(...) leaves us empty
        return *p;
    }

    /// Destroys the held value (if any); afterwards has_value() == false.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    /// Moves the held value out and leaves the optional empty.
    /// Precondition: has_value() == true.
    [[nodiscard]] T take()
    {
        RC_ASSERT(_has_value, "attempted to take value of empty optional");
        T v = rc::move(_storage.value);
        reset();
        return v;
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns the held value with the value category of the optional itself.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        RC_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns a copy of the held value, or `fallback` when empty.
    [[nodiscard]] T value_or(T fallback) const&
    {
        return _has_value ? _storage.value : fallback;
    }

    // comparison
public:
    /// Equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equal if the optional holds a value equal to rhs; never equal when empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Prevents optional<int> == true from compiling by accident.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    rc::storage_for<T> _storage;

    /// True while _storage.value holds a live T.
    bool _has_value = false;
};
