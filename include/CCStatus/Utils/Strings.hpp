#pragma once

#include <algorithm>    // std::ranges::transform, std::ranges::equal
#include <cctype>       // std::tolower, std::isspace
#include <charconv>     // std::from_chars
#include <system_error> // std::errc

#include "Error.hpp"
#include "Types.hpp"

namespace ccstatus::utils::strings {
  namespace types = ::ccstatus::utils::types;
  namespace error = ::ccstatus::utils::error;

  inline auto ToLower(types::StringView str) -> types::String {
    types::String lower(str);
    std::ranges::transform(lower, lower.begin(), [](types::u8 chr) -> types::CStr { return static_cast<types::CStr>(std::tolower(chr)); });
    return lower;
  }

  inline auto EqualsIgnoreCase(types::StringView lhs, types::StringView rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](types::u8 lhsChr, types::u8 rhsChr) -> bool { return std::tolower(lhsChr) == std::tolower(rhsChr); });
  }

  inline auto Trim(types::StringView str) -> types::StringView {
    constexpr types::StringView whitespace = " \t\r\n\v\f";

    const types::usize first = str.find_first_not_of(whitespace);
    if (first == types::StringView::npos)
      return {};

    const types::usize last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
  }

  /**
   * @brief Splits @p str on runs of whitespace, dropping empty fields.
   */
  inline auto SplitWhitespace(types::StringView str) -> types::Vec<types::StringView> {
    types::Vec<types::StringView> fields;

    types::usize pos = 0;
    while (pos < str.size()) {
      while (pos < str.size() && std::isspace(static_cast<types::u8>(str[pos])))
        ++pos;

      const types::usize start = pos;

      while (pos < str.size() && !std::isspace(static_cast<types::u8>(str[pos])))
        ++pos;

      if (pos > start)
        fields.push_back(str.substr(start, pos - start));
    }

    return fields;
  }

  /**
   * @brief Parses the whole of @p str (after trimming) as a number.
   * @tparam T Integer or floating-point type.
   */
  template <typename T>
  auto ParseNumber(types::StringView str) -> types::Result<T> {
    const types::StringView trimmed = Trim(str);

    T value {};

    const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

    if (trimmed.empty() || errc != std::errc() || ptr != trimmed.data() + trimmed.size())
      ERR_FMT(error::StatusErrorCode::ParseError, "'{}' is not a valid number", trimmed);

    return value;
  }
} // namespace ccstatus::utils::strings
