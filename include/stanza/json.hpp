#pragma once


/*
    ---------------------------
    Stanza JSON reader / writer
    ---------------------------
    `parse` turns RFC 8259 text into a `Stanza::value` tree; `dump` turns a
    tree back into text. The decoder uses `parse`; `dump` exists for
    diagnostics and for callers that want to re-encode a tree.
*/

#include <expected>
#include <string>
#include <string_view>
#include <iosfwd>
#include <memory_resource>

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaAPI Reading and Writing JSON Text
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief `std::expected<value, ParseError>`
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Parses one JSON document.
    ///
    /// @details
    /// The whole input must be a single JSON value surrounded only by
    /// whitespace (and comments, when allowed). Every node of the returned
    /// tree allocates from @p res.
    ///
    /// @code
    /// auto r = Stanza::parse(R"({"x":42})");
    /// if (r) std::println("{}", r->at("x").as_number());
    /// @endcode
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {},
                                               std::pmr::memory_resource* res = std::pmr::get_default_resource());

    /// @ingroup StanzaAPI
    /// @brief Reads @p is to the end and parses the contents.
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ParseOptions& opts = {},
                                               std::pmr::memory_resource* res = std::pmr::get_default_resource());

    /// @ingroup StanzaAPI
    /// @brief Serializes @p v to JSON text.
    ///
    /// @details
    /// Object members come out in key order, not in the order they were
    /// parsed. Non-finite numbers are written as `null`.
    [[nodiscard]] STANZA_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes @p v into @p os.
    STANZA_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace Stanza
