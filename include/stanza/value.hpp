#pragma once


/*
    ----------------------------------------
    Stanza::value - Generic JSON value tree
    ----------------------------------------
    `Stanza::value` is the schema-less result of parsing JSON text. It is a
    closed tagged union over exactly six alternatives:
        - null
        - boolean
        - number (always `double`)
        - string
        - array  (ordered sequence of values)
        - object (key -> value map, keys unique, last duplicate wins)

    The typed decoder never looks at JSON text directly; it walks this tree
    and coerces scalars into record fields.

    -----------------
    Memory Management
    -----------------
    - Every `value` remembers the `std::pmr::memory_resource` its strings,
      arrays and objects are allocated from
    - `Stanza::decode` parses into a `std::pmr::monotonic_buffer_resource`
      owned by the call, so the whole tree is released at once
    - Copy construction adopts the source's resource. Use the
      `value(const value&, memory_resource*)` overload to clone a tree into
      a different resource (e.g. out of a short-lived arena)
    - Move construction steals both the storage and the resource
    - Assignment (copy or move) rebinds the target to the source's resource;
      the target's previous storage is released first

    -----------------
    Kinds and Queries
    -----------------
    - `type()` returns the active `Stanza::kind`
    - `is_null()`, `is_bool()`, `is_number()`, `is_string()`, `is_array()`,
      `is_object()`
    - `to_string(kind)` returns the diagnostic name of a kind ("number", ...)

    ---------
    Accessors
    ---------
    - `as_bool()`, `as_number()`, `as_string()` require the matching kind and
      throw `std::bad_variant_access` otherwise
    - Non-const `as_array()` / `as_object()` reset a value of another kind to
      an empty container; const overloads require the matching kind
    - `find(key)` returns nullptr for missing keys or non-objects

    -------------
    Thread-Safety
    -------------
    - Distinct `value` instances may be used from different threads
    - Concurrent mutation of one instance needs external synchronization
*/

/// @defgroup Stanza Stanza typed JSON decoder
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue Generic Value
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief The six dynamic kinds a Stanza::value can hold
    enum class kind : uint8_t {
        null,    ///< JSON `null`
        boolean, ///< JSON `true` / `false`
        number,  ///< JSON number, stored as `double`
        string,  ///< JSON string
        array,   ///< JSON array
        object,  ///< JSON object
    };

    /// @ingroup StanzaValue
    /// @brief Returns the diagnostic name of @p k ("null", "boolean", "number",
    ///        "string", "array" or "object")
    [[nodiscard]] STANZA_API std::string_view to_string(kind k) noexcept;

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup StanzaValue
    /// @brief Allocator-aware string used for JSON strings and object keys
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief JSON array storage
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief JSON object storage; keys are kept sorted
    using object = pmr_map<string, value>;

    /// @ingroup StanzaValue
    /// @brief Underlying variant; alternative order matches `Stanza::kind`
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;

    /// @ingroup StanzaValue
    /// @brief Generic JSON value (closed tagged union).
    struct value {
        // ------------------------------------------------------------
        // Construction
        // ------------------------------------------------------------

        /// @brief Constructs a null value bound to the default memory resource
        value() noexcept : value(std::pmr::get_default_resource()) {}

        /// @brief Constructs a null value bound to @p res
        STANZA_API explicit value(std::pmr::memory_resource* res) noexcept;
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a number from any integral type other than `bool`
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copy; the copy shares @p other's memory resource
        STANZA_API value(const value& other);

        /// @brief Deep copy of @p other with every allocation made from @p res
        STANZA_API value(const value& other, std::pmr::memory_resource* res);

        STANZA_API value(value&& other) noexcept;
        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        /// @brief Shorthand for `to_string(type())`
        [[nodiscard]] std::string_view type_name() const noexcept { return to_string(type()); }

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------

        [[nodiscard]] STANZA_API bool&          as_bool();
        [[nodiscard]] STANZA_API const bool&    as_bool() const;
        [[nodiscard]] STANZA_API double&        as_number();
        [[nodiscard]] STANZA_API const double&  as_number() const;
        [[nodiscard]] STANZA_API string&        as_string();
        [[nodiscard]] STANZA_API const string&  as_string() const;

        /// @brief Returns the array, replacing any other kind with an empty array first
        [[nodiscard]] STANZA_API array&         as_array();
        [[nodiscard]] STANZA_API const array&   as_array() const;

        /// @brief Returns the object, replacing any other kind with an empty object first
        [[nodiscard]] STANZA_API object&        as_object();
        [[nodiscard]] STANZA_API const object&  as_object() const;

        /// @brief Element count for arrays and objects, 0 for scalars
        [[nodiscard]] STANZA_API std::size_t size() const noexcept;

        /// @brief Object member access; converts to an object and inserts null for missing keys
        STANZA_API value& operator[](std::string_view key);

        /// @brief Looks up @p key; nullptr when missing or when this is not an object
        [[nodiscard]] STANZA_API const value* find(std::string_view key) const;

        /// @throws std::out_of_range when @p key is missing or this is not an object
        [[nodiscard]] STANZA_API const value& at(std::string_view key) const;

        /// @brief Structural equality; memory resources are not compared
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        void adopt(storage_t&& s, std::pmr::memory_resource* res) noexcept;

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
