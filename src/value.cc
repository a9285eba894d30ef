#include <xpq/value.hh>
#include <xpq/exception.hh>
#include <xpq/overloaded.hh>

#include <seastar/core/byteorder.hh>
#include <seastar/core/print.hh>
#include <boost/multiprecision/cpp_int.hpp>

#include <cmath>

namespace xpq::record {

namespace {

constexpr int64_t julian_day_of_epoch = 2440588;
constexpr int64_t nanos_per_second = 1000000000;
constexpr int64_t seconds_per_day = 86400;

const char* physical_type_name(format::Type::type t) {
    switch (t) {
    case format::Type::BOOLEAN: return "BOOLEAN";
    case format::Type::INT32: return "INT32";
    case format::Type::INT64: return "INT64";
    case format::Type::INT96: return "INT96";
    case format::Type::FLOAT: return "FLOAT";
    case format::Type::DOUBLE: return "DOUBLE";
    case format::Type::BYTE_ARRAY: return "BYTE_ARRAY";
    case format::Type::FIXED_LEN_BYTE_ARRAY: return "FIXED_LEN_BYTE_ARRAY";
    }
    return "UNKNOWN";
}

bool payload_matches(format::Type::type t, const scalar_data& data) {
    switch (t) {
    case format::Type::BOOLEAN: return std::holds_alternative<bool>(data);
    case format::Type::INT32: return std::holds_alternative<int32_t>(data);
    case format::Type::INT64: return std::holds_alternative<int64_t>(data);
    case format::Type::INT96: return std::holds_alternative<int96>(data);
    case format::Type::FLOAT: return std::holds_alternative<float>(data);
    case format::Type::DOUBLE: return std::holds_alternative<double>(data);
    case format::Type::BYTE_ARRAY:
    case format::Type::FIXED_LEN_BYTE_ARRAY: return std::holds_alternative<std::string>(data);
    }
    return false;
}

template <typename T>
const T& payload(const scalar& s) {
    const T* p = std::get_if<T>(&s.data);
    if (!p) {
        throw format_error(seastar::format(
                "payload of a {} value does not match its logical type", physical_type_name(s.physical_type)));
    }
    return *p;
}

std::string quoted(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
        }
    }
    out += '"';
    return out;
}

// The shortest decimal text that parses back to the same value.
template <typename T>
std::string format_floating(T v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    return seastar::format("{}", v);
}

// Inserts the decimal point into the text of an unscaled integer.
std::string scale_decimal(std::string unscaled, int32_t scale) {
    if (scale <= 0) {
        return unscaled;
    }
    bool negative = !unscaled.empty() && unscaled[0] == '-';
    std::string digits = negative ? unscaled.substr(1) : unscaled;
    if (digits.size() <= static_cast<size_t>(scale)) {
        digits.insert(0, scale + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - scale, 1, '.');
    return negative ? "-" + digits : digits;
}

// Big-endian two's complement.
std::string decimal_bytes_to_string(const std::string& bytes, int32_t scale) {
    if (bytes.empty()) {
        return scale_decimal("0", scale);
    }
    boost::multiprecision::cpp_int x;
    import_bits(x, bytes.begin(), bytes.end(), 8);
    if (static_cast<uint8_t>(bytes[0]) & 0x80) {
        x -= boost::multiprecision::cpp_int(1) << (8 * bytes.size());
    }
    return scale_decimal(x.str(), scale);
}

struct civil_date {
    int64_t year;
    unsigned month;
    unsigned day;
};

// Proleptic Gregorian calendar date of a count of days since 1970-01-01.
civil_date civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2), m, d};
}

std::string format_date(int64_t days) {
    civil_date d = civil_from_days(days);
    return seastar::format("{:04d}-{:02d}-{:02d}", d.year, d.month, d.day);
}

int64_t floor_div(int64_t a, int64_t b) {
    return a / b - ((a % b != 0) && ((a < 0) != (b < 0)));
}

// ticks_per_second is 1000, 10^6 or 10^9; the fraction gets 3, 6 or 9 digits.
std::string format_time_of_day(int64_t ticks, int64_t ticks_per_second) {
    int64_t seconds = floor_div(ticks, ticks_per_second);
    int64_t fraction = ticks - seconds * ticks_per_second;
    std::string result = seastar::format("{:02d}:{:02d}:{:02d}",
            seconds / 3600, (seconds / 60) % 60, seconds % 60);
    if (fraction != 0) {
        int width = ticks_per_second == 1000 ? 3 : ticks_per_second == 1000000 ? 6 : 9;
        result += seastar::format(".{:0{}d}", fraction, width);
    }
    return result;
}

std::string format_timestamp(int64_t ticks, int64_t ticks_per_second) {
    int64_t ticks_per_day = seconds_per_day * ticks_per_second;
    int64_t days = floor_div(ticks, ticks_per_day);
    int64_t time_of_day = ticks - days * ticks_per_day;
    return format_date(days) + " " + format_time_of_day(time_of_day, ticks_per_second) + " +00:00";
}

// The nanoseconds of the day are stored in the first 8 bytes, the Julian day in the last 4.
std::string format_int96(const int96& v) {
    uint64_t nanos = static_cast<uint32_t>(v[0]) | (static_cast<uint64_t>(static_cast<uint32_t>(v[1])) << 32);
    int64_t days = static_cast<int64_t>(v[2]) - julian_day_of_epoch;
    int64_t seconds = static_cast<int64_t>(nanos / nanos_per_second);
    int64_t fraction = static_cast<int64_t>(nanos % nanos_per_second);
    days += floor_div(seconds, seconds_per_day);
    seconds -= floor_div(seconds, seconds_per_day) * seconds_per_day;
    return format_date(days) + " " + format_time_of_day(seconds * nanos_per_second + fraction, nanos_per_second)
            + " +00:00";
}

std::string format_uuid(const std::string& bytes) {
    static const char table[] = "0123456789abcdef";
    std::string out;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        uint8_t b = static_cast<uint8_t>(bytes[i]);
        out += table[b >> 4];
        out += table[b & 0x0F];
    }
    return out;
}

std::string format_interval(const std::string& bytes) {
    if (bytes.size() != 12) {
        throw format_error(seastar::format("INTERVAL value has {} bytes, expected 12", bytes.size()));
    }
    // Three little-endian unsigned integers.
    const char* p = bytes.data();
    return seastar::format("{} months {} days {} ms",
            seastar::read_le<uint32_t>(p), seastar::read_le<uint32_t>(p + 4), seastar::read_le<uint32_t>(p + 8));
}

int64_t ticks_per_second(decltype(schema::logical_type::TIMESTAMP::unit) unit) {
    switch (unit) {
    case schema::logical_type::TIMESTAMP::MILLIS: return 1000;
    case schema::logical_type::TIMESTAMP::MICROS: return 1000000;
    default: return nanos_per_second;
    }
}

} // namespace

std::string format_scalar(const scalar& s) {
    using namespace schema::logical_type;
    if (!payload_matches(s.physical_type, s.data)) {
        throw format_error(seastar::format(
                "payload of a {} value does not match its physical type", physical_type_name(s.physical_type)));
    }
    return std::visit(overloaded {
        [&] (const BOOLEAN&) -> std::string { return payload<bool>(s) ? "true" : "false"; },
        [&] (const INT32&) -> std::string { return std::to_string(payload<int32_t>(s)); },
        [&] (const INT64&) -> std::string { return std::to_string(payload<int64_t>(s)); },
        [&] (const INT96&) -> std::string { return format_int96(payload<int96>(s)); },
        [&] (const FLOAT&) -> std::string { return format_floating(payload<float>(s)); },
        [&] (const DOUBLE&) -> std::string { return format_floating(payload<double>(s)); },
        [&] (const BYTE_ARRAY&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const FIXED_LEN_BYTE_ARRAY&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const STRING&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const ENUM&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const JSON&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const BSON&) -> std::string { return quoted(payload<std::string>(s)); },
        [&] (const UUID&) -> std::string { return format_uuid(payload<std::string>(s)); },
        [&] (const INT8&) -> std::string { return std::to_string(static_cast<int8_t>(payload<int32_t>(s))); },
        [&] (const INT16&) -> std::string { return std::to_string(static_cast<int16_t>(payload<int32_t>(s))); },
        [&] (const UINT8&) -> std::string { return std::to_string(static_cast<uint8_t>(payload<int32_t>(s))); },
        [&] (const UINT16&) -> std::string { return std::to_string(static_cast<uint16_t>(payload<int32_t>(s))); },
        [&] (const UINT32&) -> std::string { return std::to_string(static_cast<uint32_t>(payload<int32_t>(s))); },
        [&] (const UINT64&) -> std::string { return std::to_string(static_cast<uint64_t>(payload<int64_t>(s))); },
        [&] (const DECIMAL_INT32& t) -> std::string {
            return scale_decimal(std::to_string(payload<int32_t>(s)), t.scale);
        },
        [&] (const DECIMAL_INT64& t) -> std::string {
            return scale_decimal(std::to_string(payload<int64_t>(s)), t.scale);
        },
        [&] (const DECIMAL_BYTE_ARRAY& t) -> std::string {
            return decimal_bytes_to_string(payload<std::string>(s), t.scale);
        },
        [&] (const DECIMAL_FIXED_LEN_BYTE_ARRAY& t) -> std::string {
            return decimal_bytes_to_string(payload<std::string>(s), t.scale);
        },
        [&] (const DATE&) -> std::string { return format_date(payload<int32_t>(s)); },
        [&] (const TIME_INT32&) -> std::string { return format_time_of_day(payload<int32_t>(s), 1000); },
        [&] (const TIME_INT64& t) -> std::string {
            return format_time_of_day(payload<int64_t>(s), t.unit == TIME_INT64::MICROS ? 1000000 : nanos_per_second);
        },
        [&] (const TIMESTAMP& t) -> std::string {
            return format_timestamp(payload<int64_t>(s), ticks_per_second(t.unit));
        },
        [&] (const INTERVAL&) -> std::string { return format_interval(payload<std::string>(s)); },
        [&] (const UNKNOWN&) -> std::string { return "null"; },
    }, s.logical_type);
}

std::string format_value(const value& v) {
    return std::visit(overloaded {
        [] (const null_value&) -> std::string { return "null"; },
        [] (const scalar& s) { return format_scalar(s); },
        [] (const list_value& l) {
            std::string out = "[";
            for (size_t i = 0; i < l.elements.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += format_value(l.elements[i]);
            }
            return out + "]";
        },
        [] (const map_value& m) {
            std::string out = "{";
            for (size_t i = 0; i < m.entries.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += format_value(m.entries[i].first) + " -> " + format_value(m.entries[i].second);
            }
            return out + "}";
        },
        [] (const group_value& g) {
            std::string out = "{";
            for (size_t i = 0; i < g.fields.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += g.fields[i].name + ": " + format_value(g.fields[i].data);
            }
            return out + "}";
        },
    }, v.v);
}

std::vector<std::string> format_row(const row& r) {
    std::vector<std::string> cells;
    cells.reserve(r.fields.size());
    for (const field& f : r.fields) {
        cells.push_back(format_value(f.data));
    }
    return cells;
}

} // namespace xpq::record
