#include "stanza/value.hpp"

#include <stdexcept>


namespace Stanza {

    std::string_view to_string(kind k) noexcept {
        switch (k) {
        case kind::null:    return "null";
        case kind::boolean: return "boolean";
        case kind::number:  return "number";
        case kind::string:  return "string";
        case kind::array:   return "array";
        case kind::object:  return "object";
        }
        return "unknown";
    }

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, s, res } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, sv.begin(), sv.end(), res } {}

    // Containers built on another resource are re-homed so that every node
    // in the tree allocates from m_MemRes.
    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res } {
        if (s.get_allocator().resource() == res) m_Storage = std::move(s);
        else m_Storage.emplace<string>(s, res);
    }

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res } {
        if (a.get_allocator().resource() == res) m_Storage = std::move(a);
        else m_Storage = clone_storage(storage_t{ std::move(a) }, res);
    }

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res } {
        if (o.get_allocator().resource() == res) m_Storage = std::move(o);
        else m_Storage = clone_storage(storage_t{ std::move(o) }, res);
    }

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(const value& other, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ clone_storage(other.m_Storage, res) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    // Same-alternative variant assignment would keep this container's old
    // allocator, so the old storage is dropped before the new one is
    // constructed in place.
    void value::adopt(storage_t&& s, std::pmr::memory_resource* res) noexcept {
        m_Storage.emplace<std::monostate>();
        m_Storage = std::move(s);
        m_MemRes = res;
    }

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        // Cloned first: other may live inside this tree.
        adopt(clone_storage(other.m_Storage, other.m_MemRes), other.m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        storage_t taken{ std::move(other.m_Storage) };
        adopt(std::move(taken), other.m_MemRes);
        return *this;
    }

    kind value::type() const noexcept {
        return static_cast<kind>(m_Storage.index());
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    double& value::as_number() { return std::get<double>(m_Storage); }
    const double& value::as_number() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }

    array& value::as_array() {
        if (!is_array()) m_Storage.emplace<array>(allocator_type{ m_MemRes });
        return std::get<array>(m_Storage);
    }
    const array& value::as_array() const { return std::get<array>(m_Storage); }

    object& value::as_object() {
        if (!is_object()) m_Storage.emplace<object>(allocator_type{ m_MemRes });
        return std::get<object>(m_Storage);
    }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    std::size_t value::size() const noexcept {
        if (auto* a = std::get_if<array>(&m_Storage)) return a->size();
        if (auto* o = std::get_if<object>(&m_Storage)) return o->size();
        return 0;
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        if (auto it = obj.find(key); it != obj.end()) return it->second;
        auto [it, inserted] = obj.emplace(string{ key.begin(), key.end(), m_MemRes }, value{ m_MemRes });
        return it->second;
    }

    const value* value::find(std::string_view key) const {
        auto* obj = std::get_if<object>(&m_Storage);
        if (!obj) return nullptr;
        auto it = obj->find(key);
        if (it == obj->end()) return nullptr;
        return std::addressof(it->second);
    }

    const value& value::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Stanza::value::at: key not found" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (static_cast<kind>(s.index())) {
        case kind::null: return std::monostate{};
        case kind::boolean: return std::get<bool>(s);
        case kind::number: return std::get<double>(s);
        case kind::string: return string{ std::get<string>(s), res };
        case kind::array: {
            const auto& arr = std::get<array>(s);
            array copy{ allocator_type{ res } };
            copy.reserve(arr.size());
            for (const auto& v : arr) copy.emplace_back(v, res);
            return copy;
        }
        case kind::object: {
            const auto& obj = std::get<object>(s);
            object copy{ std::less<>{}, allocator_type{ res } };
            for (const auto& [k, v] : obj) copy.emplace(string{ k, res }, value{ v, res });
            return copy;
        }
        }
        return std::monostate{};
    }

} // namespace Stanza
