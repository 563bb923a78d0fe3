#include "stanza/record.hpp"


namespace Stanza {

    std::string_view to_string(FieldKind k) noexcept {
        switch (k) {
        case FieldKind::string:           return "string";
        case FieldKind::signed_integer:   return "signed_integer";
        case FieldKind::unsigned_integer: return "unsigned_integer";
        case FieldKind::floating:         return "floating";
        case FieldKind::boolean:          return "boolean";
        case FieldKind::record:           return "record";
        case FieldKind::sequence:         return "sequence";
        case FieldKind::other:            return "other";
        }
        return "unknown";
    }

    std::string resolve_key(std::string_view name, std::string_view tag) {
        if (tag.empty()) return std::string{ name };
        return std::string{ tag.substr(0, tag.find(',')) };
    }

} // namespace Stanza
