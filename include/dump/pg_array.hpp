#pragma once

#include "core/error.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace dumpscrub::pg_array {

using ElementTransform = std::function<Result<std::string>(std::string_view)>;

/**
 * @brief Rewrite every element of a PostgreSQL array literal
 *
 * Handles "{a,b}", quoted elements ("{\"a b\",c}"), backslash escapes inside
 * quotes, nested arrays and unquoted NULL elements (left untouched).
 * Output elements are quoted only when PostgreSQL requires it.
 *
 * @return Rewritten literal, the first error returned by fn, or PARSE_ERROR
 */
[[nodiscard]] Result<std::string> transform(std::string_view literal, const ElementTransform& fn);

// Quote an element if it would otherwise be mis-parsed
[[nodiscard]] std::string quote_element(std::string_view element);

} // namespace dumpscrub::pg_array
