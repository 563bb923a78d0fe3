#pragma once


/*
    ------------------------------------------
    Stanza record descriptors - field metadata
    ------------------------------------------
    C++ has no runtime reflection, so a record type tells Stanza about its
    fields once, through an overload of `describe` found by argument-dependent
    lookup (put it next to the type, in the same namespace):

        struct Item {
            std::string sku;
            unsigned qty = 0;
        };

        void describe(Stanza::record_builder<Item>& b) {
            b.field("Sku", &Item::sku, "sku")
             .field("Qty", &Item::qty, "qty,omitempty");
        }

    Each `field(name, member, tag)` call records:
        - the declared name (`"Sku"`)
        - the optional tag (`"sku"`); options after the first ',' are ignored
        - the resolved key looked up in the JSON object (see `resolve_key`)
        - the `FieldKind`, derived from the member type at compile time
        - a type-erased routine that assigns a JSON value to the member

    `descriptor_of<T>()` runs `describe` exactly once per type and hands out
    the same immutable table afterwards.

    The assignment routines are defined in `stanza/decode.hpp`, which this
    header pulls in at the end.

    ---------------------------
    Member types and FieldKinds
    ---------------------------
    | member type                     | FieldKind          |
    |---------------------------------|--------------------|
    | `std::string`                   | `string`           |
    | signed integral (not `bool`)    | `signed_integer`   |
    | unsigned integral               | `unsigned_integer` |
    | `float`, `double`, `long double`| `floating`         |
    | `bool`                          | `boolean`          |
    | any `Stanza::Record`            | `record`           |
    | `std::vector<E>`                | `sequence`         |
    | `Stanza::value`                 | `other`            |

    Anything else is rejected at compile time.
*/

#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaRecord Record Descriptors
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaRecord
    /// @brief Declared value kind of a record field
    enum class FieldKind : uint8_t {
        string,
        signed_integer,
        unsigned_integer,
        floating,
        boolean,
        record,
        sequence,
        other,
    };

    /// @ingroup StanzaRecord
    [[nodiscard]] STANZA_API std::string_view to_string(FieldKind k) noexcept;

    /// @ingroup StanzaRecord
    /// @brief Computes the JSON key a field is read from.
    ///
    /// @details
    /// A non-empty @p tag wins and is cut at its first ',' (`"city,omitempty"`
    /// gives `"city"`, `",omitempty"` gives the empty key). Without a tag the
    /// declared @p name is used verbatim.
    [[nodiscard]] STANZA_API std::string resolve_key(std::string_view name, std::string_view tag);

    template<typename T>
    class record_builder;

    /// @ingroup StanzaRecord
    /// @brief A default-constructible class type with a `describe` overload.
    template<typename T>
    concept Record = std::is_class_v<T>
        && std::default_initializable<T>
        && requires(record_builder<T>& b) { describe(b); };

    namespace detail {
        template<typename M>
        struct vector_traits : std::false_type {};

        template<typename E, typename A>
        struct vector_traits<std::vector<E, A>> : std::true_type {
            using element_type = E;
        };

        template<typename>
        inline constexpr bool dependent_false = false;

        // Tracks the location of the field being decoded, for error messages.
        struct decode_context;

        template<typename M>
        DecodeResult assign_field(M& member, const value& src, decode_context& ctx);
    } // namespace detail

    /// @ingroup StanzaRecord
    /// @brief FieldKind of a member of type @p M; ill-formed for unsupported types.
    template<typename M>
    [[nodiscard]] consteval FieldKind field_kind_of() {
        if constexpr (std::same_as<M, bool>) return FieldKind::boolean;
        else if constexpr (std::same_as<M, std::string>) return FieldKind::string;
        else if constexpr (std::same_as<M, value>) return FieldKind::other;
        else if constexpr (std::signed_integral<M>) return FieldKind::signed_integer;
        else if constexpr (std::unsigned_integral<M>) return FieldKind::unsigned_integer;
        else if constexpr (std::floating_point<M>) return FieldKind::floating;
        else if constexpr (detail::vector_traits<M>::value) return FieldKind::sequence;
        else if constexpr (Record<M>) return FieldKind::record;
        else static_assert(detail::dependent_false<M>, "Stanza: unsupported record member type");
    }

    /// @ingroup StanzaRecord
    /// @brief Metadata of one record field.
    ///
    /// @details
    /// `element` is the FieldKind of the vector element for `sequence`
    /// fields and equals `kind` otherwise.
    struct FieldDescriptor {
        std::string name;
        std::string tag;
        std::string key;
        FieldKind kind{};
        FieldKind element{};
    };

    /// @ingroup StanzaRecord
    /// @brief A FieldDescriptor bound to a member of @p T.
    template<typename T>
    struct bound_field {
        FieldDescriptor info;
        std::function<DecodeResult(T&, const value&, detail::decode_context&)> assign;
    };

    /// @ingroup StanzaRecord
    /// @brief Collects the fields of @p T while `describe` runs.
    template<typename T>
    class record_builder {
    public:
        /// @brief Declares a field.
        /// @param name   Declared field name, used as the key when @p tag is empty
        /// @param member Pointer to the data member
        /// @param tag    Optional serialization tag, e.g. `"qty,omitempty"`
        template<typename M>
        record_builder& field(std::string_view name, M T::* member, std::string_view tag = {}) {
            constexpr FieldKind k = field_kind_of<M>();

            FieldDescriptor info;
            info.name.assign(name);
            info.tag.assign(tag);
            info.key = resolve_key(name, tag);
            info.kind = k;
            if constexpr (k == FieldKind::sequence)
                info.element = field_kind_of<typename detail::vector_traits<M>::element_type>();
            else
                info.element = k;

            m_Fields.push_back(bound_field<T>{
                std::move(info),
                [member](T& target, const value& src, detail::decode_context& ctx) {
                    return detail::assign_field(target.*member, src, ctx);
                }
            });
            return *this;
        }

        [[nodiscard]] std::vector<bound_field<T>> release() && { return std::move(m_Fields); }

    private:
        std::vector<bound_field<T>> m_Fields;
    };

    /// @ingroup StanzaRecord
    /// @brief Immutable field table of @p T, in declaration order.
    template<typename T>
    class record_descriptor {
    public:
        explicit record_descriptor(std::vector<bound_field<T>> fields) : m_Fields{ std::move(fields) } {}

        [[nodiscard]] const std::vector<bound_field<T>>& fields() const noexcept { return m_Fields; }
        [[nodiscard]] std::size_t size() const noexcept { return m_Fields.size(); }

        /// @brief First field whose declared name is @p name, or nullptr
        [[nodiscard]] const FieldDescriptor* find(std::string_view name) const noexcept {
            for (const auto& f : m_Fields)
                if (f.info.name == name) return &f.info;
            return nullptr;
        }

    private:
        std::vector<bound_field<T>> m_Fields;
    };

    /// @ingroup StanzaRecord
    /// @brief Returns the field table of @p T, building it on first use.
    ///
    /// @details
    /// Initialization is thread-safe; the table is read-only afterwards and
    /// lives until program exit.
    template<Record T>
    [[nodiscard]] const record_descriptor<T>& descriptor_of() {
        static const record_descriptor<T> table = [] {
            record_builder<T> builder;
            describe(builder);
            return record_descriptor<T>{ std::move(builder).release() };
        }();
        return table;
    }

} // namespace Stanza

#include "stanza/decode.hpp"
