#pragma once


/*
    ------------------------------------------
    Stanza scalar coercion - JSON -> C++ number
    ------------------------------------------
    JSON has a single number type and producers routinely quote numbers, so
    numeric record fields accept either representation:

    | function              | number                     | string                      |
    |-----------------------|----------------------------|-----------------------------|
    | `to_integer`          | truncated toward zero      | base-10 signed literal      |
    | `to_unsigned_integer` | truncated, negatives wrap  | base-10 unsigned literal    |
    | `to_float`            | as is                      | base-10 floating literal    |

    null, booleans, arrays and objects are always rejected with
    `CoercionError::reason::unsupported_type`.

    The 64-bit results are narrowed to the member type by the decoder with
    modular (two's-complement) wraparound; see `narrow_integer`.

    All functions are pure.
*/

#include <concepts>
#include <cstdint>
#include <expected>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaCoerce Scalar Coercion
/// @ingroup Stanza

namespace Stanza {

    template<typename T>
    using CoercionResult = std::expected<T, CoercionError>;

    /// @ingroup StanzaCoerce
    /// @brief Coerces @p v to a signed 64-bit integer.
    ///
    /// @details
    /// - number: fractional part discarded (`3.9` -> `3`, `-3.9` -> `-3`);
    ///   NaN, infinities and magnitudes beyond int64 are `out_of_range`
    /// - string: optional `+`/`-` followed by decimal digits only
    ///   (`"42"`, `"-7"`); anything else is `invalid_literal`, overflow is
    ///   `out_of_range`
    [[nodiscard]] STANZA_API CoercionResult<std::int64_t> to_integer(const value& v);

    /// @ingroup StanzaCoerce
    /// @brief Coerces @p v to an unsigned 64-bit integer.
    ///
    /// @details
    /// - number: fractional part discarded; negative numbers are never
    ///   range-checked, they wrap modulo 2^64 (`-1` -> `UINT64_MAX`); NaN,
    ///   infinities and values of 2^64 or more are `out_of_range`
    /// - string: decimal digits only, no sign
    [[nodiscard]] STANZA_API CoercionResult<std::uint64_t> to_unsigned_integer(const value& v);

    /// @ingroup StanzaCoerce
    /// @brief Coerces @p v to a double.
    ///
    /// @details
    /// - number: returned unchanged
    /// - string: decimal floating literal with optional leading sign and
    ///   exponent, or `inf` / `infinity` / `nan`; literals that overflow a
    ///   double are `out_of_range`
    [[nodiscard]] STANZA_API CoercionResult<double> to_float(const value& v);

    /// @ingroup StanzaCoerce
    /// @brief Narrows a 64-bit coercion result to the member type @p T,
    ///        keeping the low bits (C++20 modular conversion).
    template<std::integral T>
    [[nodiscard]] constexpr T narrow_integer(std::int64_t v) noexcept { return static_cast<T>(v); }

    template<std::integral T>
    [[nodiscard]] constexpr T narrow_integer(std::uint64_t v) noexcept { return static_cast<T>(v); }

} // namespace Stanza
