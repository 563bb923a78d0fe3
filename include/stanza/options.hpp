#pragma once


/*
    ---------------------
    Stanza option structs
    ---------------------
    Plain aggregates; brace-initialize the fields you care about:

        Stanza::DecodeOptions opts{ .parse = { .allow_comments = true },
                                    .nested_errors = Stanza::NestedErrorPolicy::propagate };

    - `ParseOptions`  controls the JSON reader (strict RFC 8259 by default)
    - `WriteOptions`  controls `Stanza::dump(...)`
    - `DecodeOptions` controls `Stanza::decode(...)` and embeds a `ParseOptions`
*/


#include <cstddef>
#include <cstdint>

/// @defgroup StanzaOptions Options
/// @ingroup Stanza
/// @brief Configuration for parsing, writing and decoding

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Nesting limit applied by a default-constructed `ParseOptions`
    inline constexpr std::size_t default_max_depth = 512;

    /// @ingroup StanzaOptions
    /// @brief JSON reader configuration.
    ///
    /// @details
    /// Every relaxation is off by default.
    /// - `allow_comments`: accept `// line` and `/* block */` comments
    /// - `allow_trailing_commas`: accept `[1,2,]` and `{"a":1,}`
    /// - `max_depth`: maximum array/object nesting, `default_max_depth`
    ///   unless set. The reader recurses once per level; 0 removes the limit
    ///   and the stack becomes the limit.
    struct ParseOptions {
        bool allow_comments = false;
        bool allow_trailing_commas = false;
        std::size_t max_depth = default_max_depth;
    };

    /// @ingroup StanzaOptions
    /// @brief Writer configuration. `indent` is ignored unless `pretty` is set.
    struct WriteOptions {
        bool pretty = false;
        std::size_t indent = 2;
    };

    /// @ingroup StanzaOptions
    /// @brief What happens to an error raised inside a nested record.
    ///
    /// @details
    /// A nested record is either a record-typed field or a record element of
    /// a `std::vector` field.
    /// - `discard`: the nested decode stops at its first error, whatever it
    ///   populated so far is still installed, and the outer decode carries on
    ///   as if nothing happened. This is the long-standing behaviour.
    /// - `propagate`: the nested error (with its full path) becomes the
    ///   result of the top-level call.
    enum class NestedErrorPolicy : uint8_t {
        discard,
        propagate,
    };

    /// @ingroup StanzaOptions
    /// @brief Decoder configuration.
    struct DecodeOptions {
        ParseOptions parse{};
        NestedErrorPolicy nested_errors = NestedErrorPolicy::discard;
    };

} // namespace Stanza
