#pragma once

#include <source_location>

namespace rc
{
/// Source position (file, line, column, function) captured by assertions.
/// Usage:
///   void check(rc::source_location loc = rc::source_location::current());
using source_location = std::source_location;
} // namespace rc
