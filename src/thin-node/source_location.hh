#pragma once

#include <source_location>

namespace tn
{
/// Type alias for std::source_location
/// Captured by assertions so failure reports point at the violating call site
using source_location = std::source_location;
} // namespace tn
