#pragma once


/*
    ----------------------------------------
    Stanza::decode - JSON into typed records
    ----------------------------------------
    `decode(text, target)` parses @p text, requires an object at the root,
    then walks the field table of the target's type in declaration order:

        1. look up the field's resolved key; a missing key leaves the field
           exactly as it was
        2. assign according to the field's `FieldKind`:
             string            JSON string only, else type_mismatch
             signed_integer    to_integer, narrowed to the member width
             unsigned_integer  to_unsigned_integer, narrowed
             floating          to_float
             boolean           JSON boolean only, else type_mismatch
             other             any JSON value (`Stanza::value` member)
             record            JSON object -> fresh instance decoded
                               recursively and moved in; any other kind
                               leaves the field untouched
             sequence          JSON array -> new vector replaces the field;
                               any other kind leaves the field untouched
        3. the first error ends the call; fields written before it stay
           written

    Sequence elements:
        - record elements: objects are decoded into a fresh element,
          non-objects leave a value-initialized element
        - everything else is assigned without coercion: `std::string` takes
          strings, `bool` takes booleans, floating point takes numbers,
          `Stanza::value` takes anything; other pairings are type_mismatch
          and leave the field untouched

    Nested records (record fields and record elements) follow
    `DecodeOptions::nested_errors`: with `discard` (the default) their errors
    are dropped and the partially decoded instance is kept; with
    `propagate` the error ends the top-level call.

    The generic tree built from @p text lives in an arena owned by the call.
*/

#include <expected>
#include <istream>
#include <memory_resource>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "stanza/coerce.hpp"
#include "stanza/error.hpp"
#include "stanza/json.hpp"
#include "stanza/options.hpp"
#include "stanza/record.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaDecode Typed Decoding
/// @ingroup Stanza

namespace Stanza {

    namespace detail {

        struct decode_context {
            const DecodeOptions& opts;
            std::string path{};

            [[nodiscard]] bool propagate_nested() const noexcept {
                return opts.nested_errors == NestedErrorPolicy::propagate;
            }
        };

        // Appends one path component for the lifetime of the guard.
        class path_segment {
        public:
            path_segment(decode_context& ctx, std::string_view key) : m_Ctx{ ctx }, m_Mark{ ctx.path.size() } {
                if (!ctx.path.empty()) ctx.path.push_back('.');
                ctx.path.append(key);
            }

            path_segment(decode_context& ctx, std::size_t index) : m_Ctx{ ctx }, m_Mark{ ctx.path.size() } {
                ctx.path.push_back('[');
                ctx.path.append(std::to_string(index));
                ctx.path.push_back(']');
            }

            ~path_segment() { m_Ctx.path.resize(m_Mark); }

            path_segment(const path_segment&) = delete;
            path_segment& operator=(const path_segment&) = delete;

        private:
            decode_context& m_Ctx;
            std::size_t m_Mark;
        };

        template<Record T>
        DecodeResult decode_record(const value& src, T& target, decode_context& ctx) {
            const auto& members = src.as_object();
            for (const auto& f : descriptor_of<T>().fields()) {
                auto it = members.find(std::string_view{ f.info.key });
                if (it == members.end()) continue;

                path_segment seg{ ctx, f.info.key };
                if (auto r = f.assign(target, it->second, ctx); !r) return r;
            }
            return {};
        }

        // Exact-type assignment used for non-record sequence elements.
        template<typename E>
        DecodeResult assign_element(E& slot, const value& src, decode_context& ctx) {
            constexpr FieldKind k = field_kind_of<E>();

            if constexpr (k == FieldKind::string) {
                if (!src.is_string()) return std::unexpected(DecodeError::mismatch(ctx.path, "string", src.type()));
                slot.assign(std::string_view{ src.as_string() });
            } else if constexpr (k == FieldKind::boolean) {
                if (!src.is_bool()) return std::unexpected(DecodeError::mismatch(ctx.path, "boolean", src.type()));
                slot = src.as_bool();
            } else if constexpr (k == FieldKind::floating) {
                if (!src.is_number()) return std::unexpected(DecodeError::mismatch(ctx.path, "number", src.type()));
                slot = static_cast<E>(src.as_number());
            } else if constexpr (k == FieldKind::other) {
                slot = value{ src, slot.resource() };
            } else {
                return std::unexpected(DecodeError::mismatch(ctx.path, to_string(k), src.type()));
            }
            return {};
        }

        template<typename M>
        DecodeResult assign_field(M& member, const value& src, decode_context& ctx) {
            constexpr FieldKind k = field_kind_of<M>();

            if constexpr (k == FieldKind::string) {
                if (!src.is_string()) return std::unexpected(DecodeError::mismatch(ctx.path, "string", src.type()));
                member.assign(std::string_view{ src.as_string() });
            } else if constexpr (k == FieldKind::signed_integer) {
                auto r = to_integer(src);
                if (!r) return std::unexpected(DecodeError::coercion(ctx.path, std::move(r.error())));
                member = narrow_integer<M>(*r);
            } else if constexpr (k == FieldKind::unsigned_integer) {
                auto r = to_unsigned_integer(src);
                if (!r) return std::unexpected(DecodeError::coercion(ctx.path, std::move(r.error())));
                member = narrow_integer<M>(*r);
            } else if constexpr (k == FieldKind::floating) {
                auto r = to_float(src);
                if (!r) return std::unexpected(DecodeError::coercion(ctx.path, std::move(r.error())));
                member = static_cast<M>(*r);
            } else if constexpr (k == FieldKind::boolean) {
                if (!src.is_bool()) return std::unexpected(DecodeError::mismatch(ctx.path, "boolean", src.type()));
                member = src.as_bool();
            } else if constexpr (k == FieldKind::other) {
                member = value{ src, member.resource() };
            } else if constexpr (k == FieldKind::record) {
                if (!src.is_object()) return {};
                M fresh{};
                auto r = decode_record(src, fresh, ctx);
                member = std::move(fresh);
                if (!r && ctx.propagate_nested()) return r;
            } else if constexpr (k == FieldKind::sequence) {
                using E = typename vector_traits<M>::element_type;
                if (!src.is_array()) return {};

                const auto& elems = src.as_array();
                M out;
                out.reserve(elems.size());
                for (std::size_t i = 0; i < elems.size(); i++) {
                    path_segment seg{ ctx, i };
                    E elem{};
                    if constexpr (field_kind_of<E>() == FieldKind::record) {
                        if (elems[i].is_object()) {
                            auto r = decode_record(elems[i], elem, ctx);
                            if (!r && ctx.propagate_nested()) return r;
                        }
                    } else {
                        if (auto r = assign_element(elem, elems[i], ctx); !r) return r;
                    }
                    out.push_back(std::move(elem));
                }
                member = std::move(out);
            }
            return {};
        }

    } // namespace detail

    /// @ingroup StanzaDecode
    /// @brief Populates @p target from an already parsed tree.
    ///
    /// @details
    /// @p root must be an object, otherwise the result is `malformed_input`.
    /// Nothing in @p root is retained by @p target; `Stanza::value` members
    /// receive deep copies in their own memory resource.
    template<Record T>
    DecodeResult decode_value(const value& root, T& target, const DecodeOptions& opts = {}) {
        if (!root.is_object()) return std::unexpected(DecodeError::non_object_root(root.type()));
        detail::decode_context ctx{ opts };
        return detail::decode_record(root, target, ctx);
    }

    /// @ingroup StanzaDecode
    /// @brief Parses @p json and populates @p target.
    ///
    /// @code
    /// Person p;
    /// auto r = Stanza::decode(R"({"name":"Ann","addr":{"city":"NYC"}})", p);
    /// if (!r) std::println("{} ({})", r.error().msg, Stanza::to_string(r.error().errc));
    /// @endcode
    template<Record T>
    DecodeResult decode(std::string_view json, T& target, const DecodeOptions& opts = {}) {
        std::pmr::monotonic_buffer_resource arena;
        auto root = parse(json, opts.parse, &arena);
        if (!root) return std::unexpected(DecodeError::malformed(std::move(root.error())));
        return decode_value(*root, target, opts);
    }

    /// @ingroup StanzaDecode
    /// @brief Reads @p in to the end, then behaves like the string overload.
    template<Record T>
    DecodeResult decode(std::istream& in, T& target, const DecodeOptions& opts = {}) {
        std::pmr::monotonic_buffer_resource arena;
        auto root = parse(in, opts.parse, &arena);
        if (!root) return std::unexpected(DecodeError::malformed(std::move(root.error())));
        return decode_value(*root, target, opts);
    }

    /// @ingroup StanzaDecode
    /// @brief Decodes into a value-initialized @p T and returns it.
    template<Record T>
    [[nodiscard]] std::expected<T, DecodeError> decode_as(std::string_view json, const DecodeOptions& opts = {}) {
        T out{};
        if (auto r = decode(json, out, opts); !r) return std::unexpected(std::move(r.error()));
        return out;
    }

} // namespace Stanza
