#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Used as the bulk input of circular_array (create_copy_of) and as the view over a snapshot.
/// Trivially copyable; the viewed data must outlive the span.
template <class T>
struct rc::span
{
    // construction
public:
    /// Empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Views [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        RC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Views an initializer_list; only for span<T const>.
    /// Safe ONLY as an immediate function argument: foo({1, 2, 3}).
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Views a whole C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Views any container providing .data() and .size().
    template <class Container>
        requires(!std::is_same_v<std::remove_cvref_t<Container>, span>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> -> span<T const>
    constexpr operator span<T const>() const
        requires(!std::is_const_v<T>)
    {
        return span<T const>(_data, _size);
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

private:
    T* _data = nullptr;
    isize _size = 0;
};
