#include "stanza/error.hpp"

#include <format>


namespace Stanza {

    ParseError ParseError::make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        using enum ParseError::code;
        switch (c) {
        case unexpected_character:    return "unexpected_character";
        case invalid_number:          return "invalid_number";
        case invalid_string:          return "invalid_string";
        case invalid_escape:          return "invalid_escape";
        case invalid_unicode_escape:  return "invalid_unicode_escape";
        case unexpected_end_of_input: return "unexpected_end_of_input";
        case trailing_characters:     return "trailing_characters";
        case depth_limit_exceeded:    return "depth_limit_exceeded";
        }
        return "unknown";
    }

    CoercionError CoercionError::make(reason r, kind actual, std::string_view m) {
        CoercionError e;
        e.why = r;
        e.actual = actual;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(CoercionError::reason r) noexcept {
        switch (r) {
        case CoercionError::reason::unsupported_type: return "unsupported_type";
        case CoercionError::reason::invalid_literal:  return "invalid_literal";
        case CoercionError::reason::out_of_range:     return "out_of_range";
        }
        return "unknown";
    }

    DecodeError DecodeError::malformed(ParseError err) {
        DecodeError e;
        e.errc = code::malformed_input;
        e.msg = std::format("malformed JSON at line {}, column {}: {}", err.line, err.column, err.msg);
        e.parse = std::move(err);
        return e;
    }

    DecodeError DecodeError::non_object_root(kind actual) {
        DecodeError e;
        e.errc = code::malformed_input;
        e.actual = actual;
        e.msg = std::format("top-level JSON value must be an object, got {}", to_string(actual));
        return e;
    }

    DecodeError DecodeError::mismatch(std::string path, std::string_view expected, kind actual) {
        DecodeError e;
        e.errc = code::type_mismatch;
        e.actual = actual;
        e.msg = std::format("{}: expected {}, got {}", path, expected, to_string(actual));
        e.path = std::move(path);
        return e;
    }

    DecodeError DecodeError::coercion(std::string path, CoercionError err) {
        DecodeError e;
        e.errc = code::coercion_error;
        e.actual = err.actual;
        e.why = err.why;
        e.msg = std::format("{}: {}", path, err.msg);
        e.path = std::move(path);
        return e;
    }

    std::string_view to_string(DecodeError::code c) noexcept {
        switch (c) {
        case DecodeError::code::malformed_input: return "malformed_input";
        case DecodeError::code::type_mismatch:   return "type_mismatch";
        case DecodeError::code::coercion_error:  return "coercion_error";
        }
        return "unknown";
    }

} // namespace Stanza
