#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace dumpscrub {
namespace dump {

/**
 * @brief PostgreSQL COPY text format, one data line at a time
 *
 * Fields are tab separated. `\N` is NULL. Backslash escapes `\\ \t \n \r
 * \b \f \v` are decoded; any other escaped character stands for itself.
 */
namespace copy_text {

constexpr std::string_view kNullMarker = "\\N";
constexpr char kDelimiter = '\t';

[[nodiscard]] Field decode_field(std::string_view raw);
[[nodiscard]] std::string encode_field(const Field& field);

[[nodiscard]] Row decode_row(std::string_view line);
[[nodiscard]] std::string encode_row(const Row& row);

} // namespace copy_text

} // namespace dump
} // namespace dumpscrub
