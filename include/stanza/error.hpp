#pragma once


/*
    ------------------------------------
    Stanza error types - what went wrong
    ------------------------------------
    Three layers can fail, and each has its own plain error struct:

    - `ParseError`    JSON text is not valid JSON (position + message)
    - `CoercionError` a scalar could not be converted to a numeric family
    - `DecodeError`   what `Stanza::decode(...)` returns; wraps the other two
                      and records which field failed

    All of them travel inside `std::expected`; nothing here throws.

    ----------------------
    DecodeError categories
    ----------------------
    - `malformed_input`: the text is not valid JSON or its root is not an
      object. `parse` holds the parser's diagnostics when there were any
    - `type_mismatch`: a string, boolean or exact-type sequence element got a
      JSON value of another dynamic kind
    - `coercion_error`: a signed / unsigned / floating field got a value that
      cannot be converted; `why` holds the `CoercionError::reason`

    `path` names the failing field using resolved keys, e.g. `addr.city` or
    `items[2].qty`. `actual` is the dynamic kind of the offending value.
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/value.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error structures produced by parsing, coercion and decoding
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error produced by the JSON parser.
    ///
    /// @details
    /// `offset` is a byte offset into the input, `line` and `column` are
    /// 1-based. `msg` is meant for humans and is not stable.
    struct ParseError {
        /// @brief Syntax error categories (RFC 8259)
        enum class code : uint8_t {
            unexpected_character,   ///< Character not valid in the current state.
            invalid_number,         ///< Number does not follow the JSON grammar.
            invalid_string,         ///< Raw control character, bad UTF-8, missing quote.
            invalid_escape,         ///< Unknown backslash escape.
            invalid_unicode_escape, ///< Bad `\uXXXX` sequence or lone surrogate.
            unexpected_end_of_input,///< Input ended inside a value.
            trailing_characters,    ///< Non-whitespace after the top-level value.
            depth_limit_exceeded,   ///< Nesting deeper than `ParseOptions::max_depth`.
        };

        code errc{};
        std::size_t offset{};
        std::size_t line{};
        std::size_t column{};
        std::string msg{};

        [[nodiscard]] STANZA_API static ParseError make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns a stable identifier for a parse error code (e.g. "invalid_number")
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

    /// @ingroup StanzaError
    /// @brief Failure of `to_integer`, `to_unsigned_integer` or `to_float`.
    struct CoercionError {
        enum class reason : uint8_t {
            unsupported_type, ///< Dynamic kind cannot be coerced at all (bool, null, array, object).
            invalid_literal,  ///< String does not hold a base-10 literal of the target family.
            out_of_range,     ///< Value does not fit the 64-bit intermediate type.
        };

        reason why{};
        kind actual{};     ///< Dynamic kind of the offending value.
        std::string msg{};

        [[nodiscard]] STANZA_API static CoercionError make(reason r, kind actual, std::string_view m);
    };

    /// @ingroup StanzaError
    [[nodiscard]] STANZA_API std::string_view to_string(CoercionError::reason r) noexcept;

    /// @ingroup StanzaError
    /// @brief Error returned by `Stanza::decode(...)`.
    struct DecodeError {
        enum class code : uint8_t {
            malformed_input, ///< Not JSON, or the root is not an object.
            type_mismatch,   ///< Exact-kind field received another kind.
            coercion_error,  ///< Numeric field could not be converted.
        };

        code errc{};
        std::string path{};                       ///< Failing field, empty for malformed input.
        kind actual{};                            ///< Kind of the offending value.
        std::optional<CoercionError::reason> why{}; ///< Set for `coercion_error`.
        std::optional<ParseError> parse{};        ///< Set when the text failed to parse.
        std::string msg{};

        /// @brief Input could not be parsed
        [[nodiscard]] STANZA_API static DecodeError malformed(ParseError err);

        /// @brief Input parsed but the root value is not an object
        [[nodiscard]] STANZA_API static DecodeError non_object_root(kind actual);

        /// @brief Field at @p path expected @p expected but the JSON held @p actual
        [[nodiscard]] STANZA_API static DecodeError mismatch(std::string path, std::string_view expected, kind actual);

        /// @brief Numeric coercion of the field at @p path failed
        [[nodiscard]] STANZA_API static DecodeError coercion(std::string path, CoercionError err);
    };

    /// @ingroup StanzaError
    [[nodiscard]] STANZA_API std::string_view to_string(DecodeError::code c) noexcept;

    /// @ingroup StanzaError
    /// @brief Result of a decode call; the target is mutated in place on success
    using DecodeResult = std::expected<void, DecodeError>;

} // namespace Stanza
