#pragma once

#include <ring-core/allocation.hh>
#include <ring-core/assertf.hh>
#include <ring-core/error.hh>
#include <ring-core/fwd.hh>
#include <ring-core/optional.hh>
#include <ring-core/result.hh>
#include <ring-core/slice.hh>
#include <ring-core/snapshot.hh>
#include <ring-core/span.hh>
#include <ring-core/to_debug_string.hh>
#include <ring-core/to_string.hh>
#include <ring-core/utility.hh>

#include <initializer_list>
#include <iterator>
#include <string>
#include <type_traits>

namespace rc::impl
{
// display form of a single element, prefers the to_string overload set (found via ADL)
template <class T>
[[nodiscard]] std::string element_to_string(T const& v)
{
    if constexpr (requires { to_string(v); })
        return std::string(to_string(v));
    else if constexpr (requires { v.to_string(); })
        return std::string(v.to_string());
    else
        return rc::to_debug_string(v);
}

template <class T, class... Ts>
struct circular_array_element
{
    using type = T;
};
template <class... Ts>
struct circular_array_element<void, Ts...>
{
    static_assert(sizeof...(Ts) > 0, "circular_array_of() without arguments needs an explicit element type");
    using type = std::common_type_t<std::decay_t<Ts>...>;
};
} // namespace rc::impl

/// Auto-resizing double-ended circular array of T with value semantics.
///
/// Elements live in a ring of `capacity()` slots; logical index i (0 = front) maps to
/// physical slot (front + i) mod capacity. Vacated slots hold rc::nullopt.
///
/// Complexity:
///   - push_front / push_back: amortized O(1), capacity doubles when full
///   - pop_front / pop_back, operator[], front / back: O(1), never change capacity
///   - slice, snapshot, map, fold, compact: O(size)
///   - try_remove_at: O(min(i, size - i))
///
/// Capacity is never zero (minimum 2) and only shrinks on explicit compact().
///
/// Errors:
///   - unchecked operations (operator[], pop_front(), front(), ...) assert their preconditions
///   - try_ operations and fold without initial value return rc::result<_, circular_array_error>
///
/// Iteration goes through snapshot(): a copy of the current contents, so the array may be mutated
/// freely while a snapshot is consumed.
///
/// Usage:
///   auto arr = rc::circular_array_of(1, 2, 3);
///   arr.push_front(0);
///   arr.push_back(4, 5);
///   auto const first = arr.pop_front(); // 0
///   for (auto const& v : arr.snapshot())
///       use(v);
template <class T>
struct rc::circular_array
{
    static_assert(!std::is_reference_v<T>, "circular_array cannot hold references");
    static_assert(!std::is_const_v<T>, "circular_array elements must be mutable");
    static_assert(std::is_move_constructible_v<T>, "circular_array elements must be move-constructible");

    using value_type = T;

    /// Smallest capacity of any circular_array, including empty and moved-from ones.
    static constexpr isize min_capacity = 2;

    /// Free slots kept by compact() on top of size().
    static constexpr isize compact_slack = 2;

    // factories
public:
    /// Creates an empty array with room for at least `capacity` elements before the first growth.
    [[nodiscard]] static circular_array create_with_capacity(isize capacity)
    {
        RC_ASSERTF(capacity >= 0, "capacity must be non-negative, got {}", capacity);
        return circular_array(rc::max(min_capacity, capacity), impl_tag{});
    }

    /// Copies all elements of `source` in order; capacity is max(min_capacity, source.size()).
    [[nodiscard]] static circular_array create_copy_of(span<T const> source)
    {
        auto arr = create_with_capacity(source.size());
        for (auto const& v : source)
            arr.impl_emplace_back_stable(v);
        return arr;
    }

    /// Copies all elements of an arbitrary finite range in iteration order.
    /// Sized ranges are allocated once, others are collected and then fitted.
    template <class Range>
        requires requires(Range&& r) {
            std::begin(r);
            std::end(r);
        }
    [[nodiscard]] static circular_array create_from(Range&& range)
    {
        if constexpr (requires { std::size(range); })
        {
            auto arr = create_with_capacity(isize(std::size(range)));
            for (auto&& v : range)
                arr.impl_emplace_back_stable(rc::forward<decltype(v)>(v));
            return arr;
        }
        else
        {
            circular_array arr;
            for (auto&& v : range)
                arr.emplace_back(rc::forward<decltype(v)>(v));
            arr.impl_relocate(rc::max(min_capacity, arr._size));
            return arr;
        }
    }

    // element access
public:
    /// Element at logical index i; negative i counts from the back (-1 is the last element).
    /// Precondition: -size() <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        auto const idx = impl::normalize_index(i, _size);
        RC_ASSERTF(0 <= idx && idx < _size, "index {} out of range for circular_array of size {}", i, _size);
        return impl_at(idx);
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        auto const idx = impl::normalize_index(i, _size);
        RC_ASSERTF(0 <= idx && idx < _size, "index {} out of range for circular_array of size {}", i, _size);
        return impl_at(idx);
    }

    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        RC_ASSERT(_size > 0, "front() called on empty circular_array");
        return impl_at(0);
    }
    [[nodiscard]] T const& front() const
    {
        RC_ASSERT(_size > 0, "front() called on empty circular_array");
        return impl_at(0);
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        RC_ASSERT(_size > 0, "back() called on empty circular_array");
        return impl_at(_size - 1);
    }
    [[nodiscard]] T const& back() const
    {
        RC_ASSERT(_size > 0, "back() called on empty circular_array");
        return impl_at(_size - 1);
    }

    /// Copy of the element at logical index i (negative allowed), or index_out_of_range.
    [[nodiscard]] result<T, circular_array_error> try_get(isize i) const
    {
        if (!impl::is_valid_index(i, _size))
            return rc::error(circular_array_error::index_out_of_range(i, _size));
        return impl_at(impl::normalize_index(i, _size));
    }

    /// Replaces the element at logical index i (negative allowed) and returns the previous value,
    /// or index_out_of_range (the array is unchanged then).
    template <class U = T>
        requires std::is_constructible_v<T, U&&>
    [[nodiscard]] result<T, circular_array_error> try_set(isize i, U&& value)
    {
        if (!impl::is_valid_index(i, _size))
            return rc::error(circular_array_error::index_out_of_range(i, _size));

        // value may be this very element
        T replacement(rc::forward<U>(value));
        return rc::exchange(impl_at(impl::normalize_index(i, _size)), rc::move(replacement));
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// True iff the array holds at least one element.
    [[nodiscard]] explicit operator bool() const { return _size > 0; }

    /// Number of slots, always >= min_capacity and >= size().
    [[nodiscard]] isize capacity() const { return _capacity; }

    /// size() / capacity() in [0, 1].
    [[nodiscard]] double fraction_filled() const { return double(_size) / double(_capacity); }

    // deque modifiers - push
public:
    /// Pushes each value to the front, one at a time in argument order:
    /// push_front(a, b) on [x] yields [b, a, x].
    /// Values may refer to elements of this array.
    template <class... Us>
        requires(sizeof...(Us) > 0 && (std::is_constructible_v<T, Us&&> && ...))
    void push_front(Us&&... values)
    {
        if (_capacity - _size >= isize(sizeof...(Us)))
            ((void)impl_emplace_front_stable(rc::forward<Us>(values)), ...);
        else
            impl_push_front_all(T(rc::forward<Us>(values))...);
    }

    /// Pushes each value to the back in argument order: push_back(a, b) on [x] yields [x, a, b].
    template <class... Us>
        requires(sizeof...(Us) > 0 && (std::is_constructible_v<T, Us&&> && ...))
    void push_back(Us&&... values)
    {
        if (_capacity - _size >= isize(sizeof...(Us)))
            ((void)impl_emplace_back_stable(rc::forward<Us>(values)), ...);
        else
            impl_push_back_all(T(rc::forward<Us>(values))...);
    }

    /// Constructs a new front element in place, growing if full.
    template <class... Args>
    T& emplace_front(Args&&... args)
    {
        if (_size == _capacity) [[unlikely]]
        {
            // args may alias an element, construct before the buffer moves
            T tmp(rc::forward<Args>(args)...);
            impl_grow();
            return impl_emplace_front_stable(rc::move(tmp));
        }
        return impl_emplace_front_stable(rc::forward<Args>(args)...);
    }

    /// Constructs a new back element in place, growing if full.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size == _capacity) [[unlikely]]
        {
            T tmp(rc::forward<Args>(args)...);
            impl_grow();
            return impl_emplace_back_stable(rc::move(tmp));
        }
        return impl_emplace_back_stable(rc::forward<Args>(args)...);
    }

    // deque modifiers - pop
public:
    /// Removes and returns the front element.
    /// Precondition: !empty(). Use try_pop_front() or pop_front_or() when emptiness is expected.
    [[nodiscard]] T pop_front()
    {
        RC_ASSERT(_size > 0, "pop_front() called on empty circular_array");
        return impl_take_front();
    }

    /// Removes and returns the back element.
    /// Precondition: !empty().
    [[nodiscard]] T pop_back()
    {
        RC_ASSERT(_size > 0, "pop_back() called on empty circular_array");
        return impl_take_back();
    }

    [[nodiscard]] result<T, circular_array_error> try_pop_front()
    {
        if (_size == 0)
            return rc::error(circular_array_error::empty_container("pop_front"));
        return impl_take_front();
    }

    [[nodiscard]] result<T, circular_array_error> try_pop_back()
    {
        if (_size == 0)
            return rc::error(circular_array_error::empty_container("pop_back"));
        return impl_take_back();
    }

    /// Removes and returns the front element, or returns `fallback` if empty.
    [[nodiscard]] T pop_front_or(T fallback)
    {
        if (_size == 0)
            return fallback;
        return impl_take_front();
    }

    /// Removes and returns the back element, or returns `fallback` if empty.
    [[nodiscard]] T pop_back_or(T fallback)
    {
        if (_size == 0)
            return fallback;
        return impl_take_back();
    }

    /// Removes up to `count` elements from the front and returns them in removal order
    /// (former front first). Never fails: count <= 0 yields an empty array.
    [[nodiscard]] circular_array pop_front_n(isize count)
    {
        auto const n = rc::clamp(count, isize(0), _size);
        auto popped = create_with_capacity(n);
        for (isize i = 0; i < n; ++i)
            popped.impl_emplace_back_stable(impl_take_front());
        return popped;
    }

    /// Removes up to `count` elements from the back and returns them in removal order
    /// (former back first).
    [[nodiscard]] circular_array pop_back_n(isize count)
    {
        auto const n = rc::clamp(count, isize(0), _size);
        auto popped = create_with_capacity(n);
        for (isize i = 0; i < n; ++i)
            popped.impl_emplace_back_stable(impl_take_back());
        return popped;
    }

    /// Destroys all elements, keeps the capacity.
    void clear()
    {
        for (isize i = 0; i < _size; ++i)
            impl_slot(impl_physical(i)).reset();
        _size = 0;
        _front = 0;
    }

    // positional modifiers
public:
    /// Removes and returns the element at logical index i (negative allowed), preserving the
    /// order of the remaining elements. Shifts whichever side of i is shorter.
    [[nodiscard]] result<T, circular_array_error> try_remove_at(isize i)
    {
        if (!impl::is_valid_index(i, _size))
            return rc::error(circular_array_error::index_out_of_range(i, _size));

        auto const idx = impl::normalize_index(i, _size);
        T removed = impl_slot(impl_physical(idx)).take();

        if (idx < _size / 2)
        {
            for (isize j = idx; j > 0; --j)
                impl_move_slot(j - 1, j);
            _front = wrapped_increment(_front, _capacity);
        }
        else
        {
            for (isize j = idx; j < _size - 1; ++j)
                impl_move_slot(j + 1, j);
        }

        --_size;
        return removed;
    }

    /// Removes every element selected by `s` (any step, bounds clamped like slice()),
    /// preserving the order of the rest. Returns the number of removed elements.
    isize remove_slice(rc::slice const& s)
    {
        auto const sel = s.resolve(_size);
        if (sel.count == 0)
            return 0;

        isize kept = 0;
        for (isize i = 0; i < _size; ++i)
        {
            if (sel.contains(i))
            {
                impl_slot(impl_physical(i)).reset();
                continue;
            }

            if (kept != i)
                impl_move_slot(i, kept);
            ++kept;
        }

        _size = kept;
        return sel.count;
    }

    /// Replaces the elements selected by `s` with `values`, following Python's slice assignment.
    ///   - simple slices (step 1) replace the selected run with any number of values,
    ///     so the array may grow or shrink: assign_slice({.start = 1, .stop = 3}, xs)
    ///   - extended slices (any other step) need exactly one value per selected position,
    ///     otherwise length_mismatch is returned and the array is unchanged
    /// Returns the number of assigned values. The result is relinearized with capacity
    /// max(min_capacity, size()). `values` may refer to elements of this array.
    template <class Range>
        requires requires(Range&& r) {
            std::begin(r);
            std::end(r);
        }
    [[nodiscard]] result<isize, circular_array_error> assign_slice(rc::slice const& s, Range&& values)
    {
        auto incoming = create_from(rc::forward<Range>(values));
        auto const sel = s.resolve(_size);

        if (s.step.value_or(1) != 1)
        {
            if (incoming._size != sel.count)
                return rc::error(circular_array_error::length_mismatch(sel.count, incoming._size));

            for (isize k = 0; k < sel.count; ++k)
                impl_at(sel.index_at(k)) = rc::move(incoming.impl_at(k));

            impl_relocate(rc::max(min_capacity, _size));
            return sel.count;
        }

        // simple slice: prefix, incoming, suffix; sel.start is the insertion point when nothing is selected
        auto rebuilt = create_with_capacity(_size - sel.count + incoming._size);
        for (isize i = 0; i < sel.start; ++i)
            rebuilt.impl_emplace_back_stable(rc::move(impl_at(i)));
        for (isize k = 0; k < incoming._size; ++k)
            rebuilt.impl_emplace_back_stable(rc::move(incoming.impl_at(k)));
        for (isize i = sel.start + sel.count; i < _size; ++i)
            rebuilt.impl_emplace_back_stable(rc::move(impl_at(i)));

        impl_swap(rebuilt);
        return incoming._size;
    }

    /// Rotates by n steps: the front element moves to the back n times.
    /// n is taken modulo size(). Negative n is not a no-op: rotate_left(-k) is rotate_right(k).
    /// Capacity never changes.
    void rotate_left(isize n = 1)
    {
        if (_size < 2)
            return;

        n %= _size;
        if (n < 0)
            n += _size;

        // full buffer: the window wraps onto itself, moving the front is enough
        if (_size == _capacity)
        {
            _front = wrapped_add(_front, n, _capacity);
            return;
        }

        for (isize k = 0; k < n; ++k)
        {
            T v = impl_take_front();
            impl_emplace_back_stable(rc::move(v));
        }
    }

    /// Rotates by n steps: the back element moves to the front n times.
    /// n is taken modulo size(). rotate_right(-k) is rotate_left(k).
    void rotate_right(isize n = 1)
    {
        if (_size < 2)
            return;

        n %= _size;
        if (n < 0)
            n += _size;

        rotate_left(_size - n);
    }

    // capacity management
public:
    /// Shrinks capacity to size() + compact_slack, then grows it to at least `minimum_capacity`.
    /// Relinearizes the elements to start at physical slot 0. Order is unchanged.
    void compact(isize minimum_capacity = 0)
    {
        RC_ASSERTF(minimum_capacity >= 0, "minimum capacity must be non-negative, got {}", minimum_capacity);

        auto const new_capacity = rc::max(_size + compact_slack, minimum_capacity);
        if (new_capacity == _capacity && _front == 0)
            return;

        impl_relocate(new_capacity);
    }

    // copies and views
public:
    /// Python-style slice as a new independent array (never a view).
    /// Out-of-range bounds are clamped, degenerate slices are empty. Precondition: step != 0.
    [[nodiscard]] circular_array slice(rc::slice const& s) const
    {
        auto const sel = s.resolve(_size);
        auto sliced = create_with_capacity(sel.count);
        for (isize k = 0; k < sel.count; ++k)
            sliced.impl_emplace_back_stable(impl_at(sel.index_at(k)));
        return sliced;
    }

    /// Copy of the current contents, front to back.
    /// Later mutations of this array are not visible in the snapshot.
    [[nodiscard]] rc::snapshot<T> snapshot() const
    {
        return rc::snapshot<T>::create_generated(_size, [this](isize i) -> T const& { return impl_at(i); });
    }

    /// Copy of the current contents, back to front.
    [[nodiscard]] rc::snapshot<T> reversed_snapshot() const
    {
        return rc::snapshot<T>::create_generated(_size, [this](isize i) -> T const& { return impl_at(_size - 1 - i); });
    }

    // transformations
public:
    /// New array with f applied to each element, front to back.
    template <class F>
    [[nodiscard]] auto map(F&& f) const
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T const&>>;

        auto mapped = circular_array<U>::create_with_capacity(_size);
        for (isize i = 0; i < _size; ++i)
            mapped.push_back(f(impl_at(i)));
        return mapped;
    }

    /// acc = f(acc, x) for each element x, front to back, starting from `init`.
    template <class F, class L>
    [[nodiscard]] L fold_left(F&& f, L init) const
    {
        L acc = rc::move(init);
        for (isize i = 0; i < _size; ++i)
            acc = f(rc::move(acc), impl_at(i));
        return acc;
    }

    /// Left fold seeded with the front element; empty_container if empty.
    template <class F>
    [[nodiscard]] result<T, circular_array_error> fold_left(F&& f) const
    {
        if (_size == 0)
            return rc::error(circular_array_error::empty_container("fold_left"));

        T acc = impl_at(0);
        for (isize i = 1; i < _size; ++i)
            acc = f(rc::move(acc), impl_at(i));
        return acc;
    }

    /// acc = f(x, acc) for each element x, back to front, starting from `init`.
    template <class F, class R>
    [[nodiscard]] R fold_right(F&& f, R init) const
    {
        R acc = rc::move(init);
        for (isize i = _size - 1; i >= 0; --i)
            acc = f(impl_at(i), rc::move(acc));
        return acc;
    }

    /// Right fold seeded with the back element; empty_container if empty.
    template <class F>
    [[nodiscard]] result<T, circular_array_error> fold_right(F&& f) const
    {
        if (_size == 0)
            return rc::error(circular_array_error::empty_container("fold_right"));

        T acc = impl_at(_size - 1);
        for (isize i = _size - 2; i >= 0; --i)
            acc = f(impl_at(i), rc::move(acc));
        return acc;
    }

    // comparison
public:
    /// Same size and pairwise equal elements.
    /// Identity is checked for the array as a whole: an array always equals itself, even if
    /// T's operator== is not reflexive (e.g. NaN). Elements of distinct arrays are always compared with ==.
    [[nodiscard]] friend bool operator==(circular_array const& lhs, circular_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (&lhs == &rhs)
            return true;
        if (lhs._size != rhs._size)
            return false;

        for (isize i = 0; i < lhs._size; ++i)
        {
            if (!(lhs.impl_at(i) == rhs.impl_at(i)))
                return false;
        }
        return true;
    }

    // string forms
public:
    /// Display form: (|1, 2, 3|), empty is (||).
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string("(|");
        for (isize i = 0; i < _size; ++i)
        {
            if (i > 0)
                s += ", ";
            s += impl::element_to_string(impl_at(i));
        }
        s += "|)";
        return s;
    }

    /// Constructor form: circular_array_of(1, "a"), empty is circular_array_of().
    [[nodiscard]] std::string to_debug_string() const
    {
        auto s = std::string("circular_array_of(");
        for (isize i = 0; i < _size; ++i)
        {
            if (i > 0)
                s += ", ";
            s += rc::to_debug_string(impl_at(i));
        }
        s += ")";
        return s;
    }

    // ctors
public:
    /// Empty array with min_capacity slots.
    circular_array() : circular_array(min_capacity, impl_tag{}) {}

    /// Copies the listed elements in order.
    circular_array(std::initializer_list<T> init)
      : circular_array(rc::max(min_capacity, isize(init.size())), impl_tag{})
    {
        for (auto const& v : init)
            impl_emplace_back_stable(v);
    }

    /// Deep copy, relinearized, capacity max(min_capacity, rhs.size()).
    circular_array(circular_array const& rhs)
        requires std::is_copy_constructible_v<T>
      : circular_array(rc::max(min_capacity, rhs._size), impl_tag{})
    {
        for (isize i = 0; i < rhs._size; ++i)
            impl_emplace_back_stable(rhs.impl_at(i));
    }
    circular_array& operator=(circular_array const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            auto copy = circular_array(rhs);
            impl_swap(copy);
        }
        return *this;
    }

    /// rhs is left empty with a fresh min_capacity buffer.
    circular_array(circular_array&& rhs) : circular_array() { impl_swap(rhs); }

    /// rhs is left empty and keeps this array's previous buffer.
    circular_array& operator=(circular_array&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_swap(rhs);
            rhs.clear();
        }
        return *this;
    }

    // implementation
private:
    struct impl_tag
    {
    };

    circular_array(isize capacity, impl_tag)
      : _slots(allocation<optional<T>>::create_defaulted(capacity)), _capacity(capacity)
    {
        RC_ASSERT(capacity >= min_capacity, "capacity below minimum");
    }

    [[nodiscard]] optional<T>& impl_slot(isize physical) { return _slots.obj_start[physical]; }
    [[nodiscard]] optional<T> const& impl_slot(isize physical) const { return _slots.obj_start[physical]; }

    // logical -> physical, precondition: 0 <= i < capacity
    [[nodiscard]] isize impl_physical(isize i) const { return wrapped_add(_front, i, _capacity); }

    // precondition: 0 <= i < size
    [[nodiscard]] T& impl_at(isize i) { return impl_slot(impl_physical(i)).value(); }
    [[nodiscard]] T const& impl_at(isize i) const { return impl_slot(impl_physical(i)).value(); }

    // precondition: size < capacity
    template <class... Args>
    T& impl_emplace_front_stable(Args&&... args)
    {
        RC_ASSERT(_size < _capacity, "no free slot");
        auto const new_front = wrapped_decrement(_front, _capacity);
        auto& v = impl_slot(new_front).emplace(rc::forward<Args>(args)...);
        _front = new_front;
        ++_size;
        return v;
    }

    // precondition: size < capacity
    template <class... Args>
    T& impl_emplace_back_stable(Args&&... args)
    {
        RC_ASSERT(_size < _capacity, "no free slot");
        auto& v = impl_slot(impl_physical(_size)).emplace(rc::forward<Args>(args)...);
        ++_size;
        return v;
    }

    // precondition: !empty()
    T impl_take_front()
    {
        T v = impl_slot(_front).take();
        _front = wrapped_increment(_front, _capacity);
        --_size;
        return v;
    }

    // precondition: !empty()
    T impl_take_back()
    {
        T v = impl_slot(impl_physical(_size - 1)).take();
        --_size;
        return v;
    }

    // moves logical slot `from` into the empty logical slot `to`, leaves `from` empty
    void impl_move_slot(isize from, isize to)
    {
        auto& src = impl_slot(impl_physical(from));
        impl_slot(impl_physical(to)).emplace(src.take());
    }

    RC_COLD_FUNC void impl_grow() { impl_relocate(rc::max(min_capacity, 2 * _capacity)); }

    // grows (doubling at least) so that `count` more elements fit
    RC_COLD_FUNC void impl_reserve_additional(isize count)
    {
        if (_capacity - _size < count)
            impl_relocate(rc::max(2 * _capacity, _size + count));
    }

    // the arguments are materialized temporaries, none of them refers into the buffer
    template <class... Ts>
    void impl_push_front_all(Ts&&... tmps)
    {
        impl_reserve_additional(isize(sizeof...(Ts)));
        ((void)impl_emplace_front_stable(rc::move(tmps)), ...);
    }
    template <class... Ts>
    void impl_push_back_all(Ts&&... tmps)
    {
        impl_reserve_additional(isize(sizeof...(Ts)));
        ((void)impl_emplace_back_stable(rc::move(tmps)), ...);
    }

    // allocate, fill in logical order from physical 0, swap in
    // the old buffer is released only after every element arrived: a throwing copy leaves *this unchanged,
    // throwing moves are only used for move-only T
    void impl_relocate(isize new_capacity)
    {
        RC_ASSERT(new_capacity >= _size && new_capacity >= min_capacity, "relocation target too small");

        auto new_slots = allocation<optional<T>>::create_defaulted(new_capacity);
        for (isize i = 0; i < _size; ++i)
        {
            if constexpr (std::is_nothrow_move_constructible_v<T> || !std::is_copy_constructible_v<T>)
                new_slots.obj_start[i].emplace(rc::move(impl_at(i)));
            else
                new_slots.obj_start[i].emplace(static_cast<T const&>(impl_at(i)));
        }

        _slots = rc::move(new_slots);
        _capacity = new_capacity;
        _front = 0;
    }

    void impl_swap(circular_array& rhs) noexcept
    {
        auto slots = rc::move(_slots);
        _slots = rc::move(rhs._slots);
        rhs._slots = rc::move(slots);

        auto const capacity = _capacity;
        auto const size = _size;
        auto const front = _front;

        _capacity = rhs._capacity;
        _size = rhs._size;
        _front = rhs._front;

        rhs._capacity = capacity;
        rhs._size = size;
        rhs._front = front;
    }

    // all _capacity slots are alive as optional<T>,
    // engaged ones are the logical window [_front, _front + _size) mod _capacity
    allocation<optional<T>> _slots;
    isize _capacity = 0;
    isize _size = 0;
    isize _front = 0;
};

namespace rc
{
/// Builds a circular_array from its arguments, front to back.
/// The element type is the common type of the arguments unless given explicitly:
///   auto a = rc::circular_array_of(1, 2, 3);        // circular_array<int>
///   auto b = rc::circular_array_of<double>(1, 2.5); // circular_array<double>
///   auto c = rc::circular_array_of<int>();          // empty
template <class T = void, class... Ts>
[[nodiscard]] auto circular_array_of(Ts&&... values)
{
    using elem_t = typename impl::circular_array_element<T, Ts...>::type;

    auto arr = circular_array<elem_t>::create_with_capacity(isize(sizeof...(Ts)));
    if constexpr (sizeof...(Ts) > 0)
        arr.push_back(rc::forward<Ts>(values)...);
    return arr;
}
} // namespace rc
