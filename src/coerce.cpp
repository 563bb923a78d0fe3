#include "stanza/coerce.hpp"
#include "stanza/json.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <string>


namespace Stanza {

    namespace {

        // Offending values are echoed into messages, cut short so a huge
        // string cannot blow up the diagnostic.
        std::string preview(const value& v) {
            constexpr std::size_t limit = 40;
            std::string text = dump(v);
            if (text.size() > limit) {
                text.resize(limit);
                text += "...";
            }
            return text;
        }

        CoercionError unsupported(std::string_view target, const value& v) {
            return CoercionError::make(CoercionError::reason::unsupported_type, v.type(),
                std::format("cannot convert {} to {}", v.type_name(), target));
        }

        CoercionError bad_literal(std::string_view target, const value& v) {
            return CoercionError::make(CoercionError::reason::invalid_literal, v.type(),
                std::format("string {} is not a valid {} literal", preview(v), target));
        }

        CoercionError out_of_range(std::string_view target, const value& v) {
            return CoercionError::make(CoercionError::reason::out_of_range, v.type(),
                std::format("{} {} is out of range for {}", v.type_name(), preview(v), target));
        }

        // [-2^63, 2^63) and [0, 2^64) as exact doubles.
        constexpr double two_pow_63 = 9223372036854775808.0;
        constexpr double two_pow_64 = 18446744073709551616.0;

    } // namespace

    CoercionResult<std::int64_t> to_integer(const value& v) {
        static constexpr std::string_view target = "integer";

        switch (v.type()) {
        case kind::number: {
            double d = std::trunc(v.as_number());
            if (!std::isfinite(d) || d < -two_pow_63 || d >= two_pow_63) return std::unexpected(out_of_range(target, v));
            return static_cast<std::int64_t>(d);
        }
        case kind::string: {
            std::string_view s = v.as_string();
            // from_chars takes '-' but not '+'
            if (s.starts_with('+')) {
                s.remove_prefix(1);
                if (s.starts_with('-')) return std::unexpected(bad_literal(target, v));
            }
            if (s.empty()) return std::unexpected(bad_literal(target, v));

            std::int64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec == std::errc::result_out_of_range) return std::unexpected(out_of_range(target, v));
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::unexpected(bad_literal(target, v));
            return out;
        }
        default:
            return std::unexpected(unsupported(target, v));
        }
    }

    CoercionResult<std::uint64_t> to_unsigned_integer(const value& v) {
        static constexpr std::string_view target = "unsigned integer";

        switch (v.type()) {
        case kind::number: {
            double d = std::trunc(v.as_number());
            if (!std::isfinite(d) || d >= two_pow_64) return std::unexpected(out_of_range(target, v));
            if (d >= 0) return static_cast<std::uint64_t>(d);

            // Negatives wrap modulo 2^64 at any magnitude. fmod is exact and
            // leaves d in (-2^64, 0]; both branches below stay exact too.
            d = std::fmod(d, two_pow_64);
            if (d < -two_pow_63) return static_cast<std::uint64_t>(d + two_pow_64);
            return static_cast<std::uint64_t>(static_cast<std::int64_t>(d));
        }
        case kind::string: {
            std::string_view s = v.as_string();
            if (s.empty() || s.front() == '-') return std::unexpected(bad_literal(target, v));

            std::uint64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec == std::errc::result_out_of_range) return std::unexpected(out_of_range(target, v));
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::unexpected(bad_literal(target, v));
            return out;
        }
        default:
            return std::unexpected(unsupported(target, v));
        }
    }

    CoercionResult<double> to_float(const value& v) {
        static constexpr std::string_view target = "float";

        switch (v.type()) {
        case kind::number:
            return v.as_number();
        case kind::string: {
            std::string_view s = v.as_string();
            if (s.starts_with('+')) {
                s.remove_prefix(1);
                if (s.starts_with('-')) return std::unexpected(bad_literal(target, v));
            }
            if (s.empty()) return std::unexpected(bad_literal(target, v));

            double out = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec == std::errc::result_out_of_range) return std::unexpected(out_of_range(target, v));
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::unexpected(bad_literal(target, v));
            return out;
        }
        default:
            return std::unexpected(unsupported(target, v));
        }
    }

} // namespace Stanza
