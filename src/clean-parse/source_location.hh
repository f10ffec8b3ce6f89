#pragma once

#include <source_location>

namespace cp
{
/// Type alias for std::source_location
/// Captured by CP_ASSERT so that failed preconditions report the offending call site
using source_location = std::source_location;
} // namespace cp
