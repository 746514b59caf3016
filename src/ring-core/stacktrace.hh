#pragma once

#include <stacktrace>

namespace rc
{
/// Snapshot of the call stack, printed by the default assertion handler
using stacktrace = std::stacktrace;
} // namespace rc
