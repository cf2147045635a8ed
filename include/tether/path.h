#pragma once

#include <tether/value.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

// Splits "a.b.0.c" into its segments. Throws invalid_path_error on empty
// paths and empty segments.
std::vector<std::string> split_path(std::string_view path);

// Follows `segments` from `root`, reading every step through the tracked
// accessors (objects by key, arrays by index). A step into something that
// is not a container, or a missing key, yields undefined unless `strict`,
// in which case invalid_path_error is thrown.
value resolve_path(const value &root, const std::vector<std::string> &segments,
                   std::size_t first, bool strict, std::string_view path);

} // namespace tether
