#include "slice.hh"

#include <ring-core/assert.hh>
#include <ring-core/utility.hh>

namespace
{
// clamps an explicit bound the way Python does for the given step direction
rc::isize clamp_bound(rc::isize bound, rc::isize size, bool reverse)
{
    if (bound < 0)
    {
        bound += size;
        if (bound < 0)
            bound = reverse ? -1 : 0;
    }
    else if (bound >= size)
    {
        bound = reverse ? size - 1 : size;
    }
    return bound;
}
} // namespace

rc::slice::resolved rc::slice::resolve(isize size) const
{
    RC_ASSERT(size >= 0, "slice: size must be non-negative");

    RC_ASSERT(step.value_or(1) != 0, "slice step cannot be zero");

    // |step| >= size selects at most one element, so capping it keeps the selection
    // and makes -step and start + k * step representable
    auto const step_limit = rc::max(size, isize(1));
    auto const step_v = rc::clamp(step.value_or(1), -step_limit, step_limit);

    auto const reverse = step_v < 0;

    // -1 as a reverse stop means "one before the first element"
    auto const start_v = start.has_value() ? clamp_bound(start.value(), size, reverse) : (reverse ? size - 1 : 0);
    auto const stop_v = stop.has_value() ? clamp_bound(stop.value(), size, reverse) : (reverse ? -1 : size);

    resolved r;
    r.start = start_v;
    r.step = step_v;

    if (reverse)
        r.count = stop_v < start_v ? (start_v - stop_v - 1) / (-step_v) + 1 : 0;
    else
        r.count = start_v < stop_v ? (stop_v - start_v - 1) / step_v + 1 : 0;

    return r;
}

bool rc::slice::resolved::contains(isize i) const
{
    if (count == 0)
        return false;

    // walk the selection from its lowest index upwards, independent of direction
    auto const abs_step = step < 0 ? -step : step;
    auto const lowest = step < 0 ? index_at(count - 1) : start;
    auto const highest = lowest + (count - 1) * abs_step;

    return lowest <= i && i <= highest && (i - lowest) % abs_step == 0;
}
