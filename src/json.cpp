#include "stanza/json.hpp"

#include <sstream>
#include <ostream>
#include <charconv>
#include <cmath>


namespace Stanza {

    namespace detail {
        ParseResult read_document(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res);
        void write_value(const value& v, std::ostream& os, const WriteOptions& opts, std::size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts, std::pmr::memory_resource* res) {
        return detail::read_document(input, opts, res);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts, std::pmr::memory_resource* res) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::read_document(oss.view(), opts, res);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::write_value(v, oss, opts, 0);
        return std::move(oss).str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::write_value(v, os, opts, 0);
    }

#pragma region Reader
    // ================================
    // Recursive-descent reader
    // ================================

    namespace detail {
        template<typename T>
        using expected_t = std::expected<T, ParseError>;
        using expected_void = std::expected<void, ParseError>;

        constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
        constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        // Length of the well-formed UTF-8 sequence starting at data[0], or 0
        // if it is overlong, a surrogate, above U+10FFFF or truncated.
        std::size_t utf8_sequence_length(std::string_view data) noexcept {
            auto byte = [&](std::size_t i) { return static_cast<unsigned char>(data[i]); };
            auto cont = [&](std::size_t i) { return i < data.size() && (byte(i) & 0xC0) == 0x80; };

            unsigned char lead = byte(0);
            if (lead < 0x80) return 1;
            if (lead < 0xC2) return 0;
            if (lead < 0xE0) return cont(1) ? 2 : 0;

            if (lead < 0xF0) {
                if (!cont(1) || !cont(2)) return 0;
                if (lead == 0xE0 && byte(1) < 0xA0) return 0;
                if (lead == 0xED && byte(1) > 0x9F) return 0;
                return 3;
            }

            if (lead < 0xF5) {
                if (!cont(1) || !cont(2) || !cont(3)) return 0;
                if (lead == 0xF0 && byte(1) < 0x90) return 0;
                if (lead == 0xF4 && byte(1) > 0x8F) return 0;
                return 4;
            }
            return 0;
        }

        void encode_utf8(std::uint32_t cp, string& out) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        class Reader {
        public:
            Reader(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res)
                : m_Text{ text }, m_Opts{ opts }, m_MemRes{ res } {}

            ParseResult document() {
                auto root = read_value();
                if (!root) return root;
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (!eof()) return fail(ParseError::code::trailing_characters, "Unexpected data after the top-level value");
                return root;
            }

        private:
            std::string_view m_Text;
            const ParseOptions& m_Opts;
            std::pmr::memory_resource* m_MemRes;
            std::size_t m_Pos = 0;
            std::size_t m_Line = 1;
            std::size_t m_Column = 1;
            std::size_t m_Depth = 0;

            // Tracks array/object nesting for ParseOptions::max_depth.
            struct Nesting {
                Reader& r;
                explicit Nesting(Reader& reader) : r{ reader } { r.m_Depth++; }
                ~Nesting() { r.m_Depth--; }
                Nesting(const Nesting&) = delete;
                Nesting& operator=(const Nesting&) = delete;
                [[nodiscard]] bool within_limit() const noexcept { return r.m_Opts.max_depth == 0 || r.m_Depth <= r.m_Opts.max_depth; }
            };

            [[nodiscard]] bool eof() const noexcept { return m_Pos >= m_Text.size(); }
            [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept {
                return m_Pos + ahead < m_Text.size() ? m_Text[m_Pos + ahead] : '\0';
            }

            char advance() {
                if (eof()) return '\0';
                char c = m_Text[m_Pos++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else m_Column++;
                return c;
            }

            bool accept(char c) {
                if (eof() || peek() != c) return false;
                advance();
                return true;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code c, std::string_view msg) const {
                return std::unexpected(ParseError::make(c, m_Pos, m_Line, m_Column, msg));
            }

            expected_void skip_ws() {
                while (!eof()) {
                    char c = peek();
                    if (is_ws(c)) {
                        advance();
                        continue;
                    }
                    if (c != '/' || !m_Opts.allow_comments) break;

                    if (peek(1) == '/') {
                        while (!eof() && peek() != '\n') advance();
                    } else if (peek(1) == '*') {
                        advance();
                        advance();
                        while (true) {
                            if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated block comment");
                            if (advance() == '*' && accept('/')) break;
                        }
                    } else {
                        break;
                    }
                }
                return {};
            }

            expected_void expect_word(std::string_view word) {
                for (char c : word) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                    if (peek() != c) return fail(ParseError::code::unexpected_character, "Invalid literal");
                    advance();
                }
                return {};
            }

            expected_t<std::uint16_t> read_hex4() {
                std::uint16_t unit = 0;
                for (int i = 0; i < 4; i++) {
                    if (eof()) return fail(ParseError::code::invalid_unicode_escape, "Truncated \\u escape");
                    char h = peek();
                    unsigned digit = 0;
                    if (is_digit(h)) digit = static_cast<unsigned>(h - '0');
                    else if (h >= 'a' && h <= 'f') digit = static_cast<unsigned>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') digit = static_cast<unsigned>(h - 'A' + 10);
                    else return fail(ParseError::code::invalid_unicode_escape, "Expected hex digit in \\u escape");
                    advance();
                    unit = static_cast<std::uint16_t>((unit << 4) | digit);
                }
                return unit;
            }

            expected_void read_unicode_escape(string& out) {
                auto first = read_hex4();
                if (!first) return std::unexpected(std::move(first.error()));

                std::uint32_t cp = *first;
                if (cp >= 0xDC00 && cp <= 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Low surrogate without a high surrogate");
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (!(accept('\\') && accept('u'))) return fail(ParseError::code::invalid_unicode_escape, "High surrogate must be followed by a low surrogate");
                    auto second = read_hex4();
                    if (!second) return std::unexpected(std::move(second.error()));
                    if (*second < 0xDC00 || *second > 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");
                    cp = 0x10000u + ((cp - 0xD800u) << 10) + (*second - 0xDC00u);
                }
                encode_utf8(cp, out);
                return {};
            }

            expected_t<string> read_string() {
                if (!accept('"')) return fail(ParseError::code::invalid_string, "Expected '\"'");
                string out{ allocator_type{ m_MemRes } };

                while (true) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated string");
                    char c = peek();

                    if (c == '"') {
                        advance();
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return fail(ParseError::code::invalid_string, "Unescaped control character in string");

                    if (static_cast<unsigned char>(c) >= 0x80) {
                        std::size_t len = utf8_sequence_length(m_Text.substr(m_Pos));
                        if (len == 0) return fail(ParseError::code::invalid_string, "Invalid UTF-8 in string");
                        out.append(m_Text.substr(m_Pos, len));
                        for (std::size_t i = 0; i < len; i++) advance();
                        continue;
                    }

                    advance();
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }

                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated escape sequence");
                    char esc = advance();
                    switch (esc) {
                    case '"':  out.push_back('"');  break;
                    case '\\': out.push_back('\\'); break;
                    case '/':  out.push_back('/');  break;
                    case 'b':  out.push_back('\b'); break;
                    case 'f':  out.push_back('\f'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'u':
                        if (auto r = read_unicode_escape(out); !r) return std::unexpected(std::move(r.error()));
                        break;
                    default: return fail(ParseError::code::invalid_escape, "Unknown escape sequence");
                    }
                }
            }

            expected_t<double> read_number() {
                std::size_t start = m_Pos;

                accept('-');
                if (!is_digit(peek())) return fail(ParseError::code::unexpected_character, "Expected digit");
                if (advance() == '0' && is_digit(peek())) return fail(ParseError::code::invalid_number, "Leading zeros are not allowed");
                while (is_digit(peek())) advance();

                if (accept('.')) {
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit after decimal point");
                    while (is_digit(peek())) advance();
                }

                if (peek() == 'e' || peek() == 'E') {
                    advance();
                    if (peek() == '+' || peek() == '-') advance();
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) advance();
                }

                char next = peek();
                if (next == '.' || is_digit(next) || next == 'e' || next == 'E') return fail(ParseError::code::invalid_number, "Malformed number");

                auto literal = m_Text.substr(start, m_Pos - start);
                double d = 0.0;
                auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), d);
                if (ec != std::errc{} || ptr != literal.data() + literal.size()) return fail(ParseError::code::invalid_number, "Number is out of range");
                return d;
            }

            ParseResult read_array() {
                Nesting nesting{ *this };
                if (!nesting.within_limit()) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                advance(); // '['

                array arr{ allocator_type{ m_MemRes } };
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (accept(']')) return value{ std::move(arr), m_MemRes };

                while (true) {
                    auto elem = read_value();
                    if (!elem) return elem;
                    arr.push_back(std::move(*elem));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (accept(']')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated array");
                    if (!accept(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or ']' after array element");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (peek() == ']') {
                        if (!m_Opts.allow_trailing_commas) return fail(ParseError::code::trailing_characters, "Trailing comma in array");
                        advance();
                        break;
                    }
                }
                return value{ std::move(arr), m_MemRes };
            }

            ParseResult read_object() {
                Nesting nesting{ *this };
                if (!nesting.within_limit()) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                advance(); // '{'

                object obj{ std::less<>{}, allocator_type{ m_MemRes } };
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (accept('}')) return value{ std::move(obj), m_MemRes };

                while (true) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object");
                    if (peek() != '"') return fail(ParseError::code::unexpected_character, "Object keys must be strings");
                    auto key = read_string();
                    if (!key) return std::unexpected(std::move(key.error()));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object");
                    if (!accept(':')) return fail(ParseError::code::unexpected_character, "Expected ':' after object key");

                    auto member = read_value();
                    if (!member) return member;
                    obj.insert_or_assign(std::move(*key), std::move(*member));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (accept('}')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object");
                    if (!accept(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or '}' after object member");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (peek() == '}') {
                        if (!m_Opts.allow_trailing_commas) return fail(ParseError::code::trailing_characters, "Trailing comma in object");
                        advance();
                        break;
                    }
                }
                return value{ std::move(obj), m_MemRes };
            }

            ParseResult read_value() {
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Expected a JSON value");

                switch (char c = peek()) {
                case '{': return read_object();
                case '[': return read_array();
                case '"': {
                    auto s = read_string();
                    if (!s) return std::unexpected(std::move(s.error()));
                    return value{ std::move(*s), m_MemRes };
                }
                case 't':
                    if (auto r = expect_word("true"); !r) return std::unexpected(std::move(r.error()));
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = expect_word("false"); !r) return std::unexpected(std::move(r.error()));
                    return value{ false, m_MemRes };
                case 'n':
                    if (auto r = expect_word("null"); !r) return std::unexpected(std::move(r.error()));
                    return value{ nullptr, m_MemRes };
                default:
                    if (c == '-' || is_digit(c)) {
                        auto d = read_number();
                        if (!d) return std::unexpected(std::move(d.error()));
                        return value{ *d, m_MemRes };
                    }
                    if (c == '.') return fail(ParseError::code::invalid_number, "Numbers must start with a digit");
                    return fail(ParseError::code::unexpected_character, "Unexpected character");
                }
            }
        };

        ParseResult read_document(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res) {
            Reader reader{ text, opts, res };
            return reader.document();
        }

#pragma endregion
#pragma region Writer

        // ================================
        // Writer
        // ================================

        void write_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789abcdef";
            os.put('"');
            for (char ch : s) {
                auto c = static_cast<unsigned char>(ch);
                switch (c) {
                case '"':  os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b";  break;
                case '\f': os << "\\f";  break;
                case '\n': os << "\\n";  break;
                case '\r': os << "\\r";  break;
                case '\t': os << "\\t";  break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[c >> 4] << hex[c & 0xF];
                    else os.put(ch);
                }
            }
            os.put('"');
        }

        void write_number(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) os << "null";
            else os.write(buf, ptr - buf);
        }

        void newline_indent(std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            if (!opts.pretty) return;
            os.put('\n');
            for (std::size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void write_value(const value& v, std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            switch (v.type()) {
            case kind::null:    os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number:  write_number(v.as_number(), os); return;
            case kind::string:  write_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                bool first = true;
                for (const auto& elem : arr) {
                    if (!first) os.put(',');
                    first = false;
                    newline_indent(os, opts, depth + 1);
                    write_value(elem, os, opts, depth + 1);
                }
                if (!arr.empty()) newline_indent(os, opts, depth);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                os.put('{');
                bool first = true;
                for (const auto& [key, member] : obj) {
                    if (!first) os.put(',');
                    first = false;
                    newline_indent(os, opts, depth + 1);
                    write_string(key, os);
                    os << (opts.pretty ? ": " : ":");
                    write_value(member, os, opts, depth + 1);
                }
                if (!obj.empty()) newline_indent(os, opts, depth);
                os.put('}');
                return;
            }
            }
        }

#pragma endregion

    } // namespace detail

} // namespace Stanza
