/**
 * @file Types.hpp
 * @brief Type aliases shared by every ccstatus translation unit.
 *
 * Short, Rust-flavoured names for the standard library types the project
 * uses everywhere, plus the Result/Err pair built on std::expected.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // fixed-width integers
#include <exception>                // std::exception (Exception)
#include <expected>                 // std::expected (Result), std::unexpected (Err)
#include <functional>               // std::less (Map)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace ccstatus::utils {
  namespace error {
    struct StatusError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
    using u16 = std::uint16_t; ///< 16-bit unsigned integer.
    using u32 = std::uint32_t; ///< 32-bit unsigned integer.
    using u64 = std::uint64_t; ///< 64-bit unsigned integer.
    using i8  = std::int8_t;   ///< 8-bit signed integer.
    using i16 = std::int16_t;  ///< 16-bit signed integer.
    using i32 = std::int32_t;  ///< 32-bit signed integer.
    using i64 = std::int64_t;  ///< 64-bit signed integer.
    using f32 = float;         ///< 32-bit floating-point number.
    using f64 = double;        ///< 64-bit floating-point number.

    using usize = std::size_t;    ///< Unsigned size type.
    using isize = std::ptrdiff_t; ///< Signed size type.

    using String     = std::string;      ///< Owning, mutable string.
    using StringView = std::string_view; ///< Non-owning view of a string.
    using CStr       = char;             ///< Single character type.
    using PCStr      = const char*;      ///< Pointer to a null-terminated C string.

    /**
     * @brief Alias for void, used as the success type of Result<>.
     */
    using Unit = void;

    using Exception = std::exception; ///< Standard exception type.

    /**
     * @brief Alias for std::optional<Tp>.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Represents an empty Option.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Creates an Option holding the given value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap.
     * @return An engaged Option.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_reference_t<Tp>> {
      return std::make_optional<std::remove_reference_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Ordered map with transparent comparison (lookups by StringView work).
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief High-performance hash map (Robin Hood hashing).
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @typedef Result
     * @brief Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = Unit, typename Er = error::StatusError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Constructs a Result in its error state.
     */
    template <typename Er = error::StatusError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace ccstatus::utils
