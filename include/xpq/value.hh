#pragma once

#include <xpq/schema.hh>

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xpq::record {

using int96 = std::array<int32_t, 3>;

// The decoded payload of a leaf value. Byte arrays are held as std::string.
using scalar_data = std::variant<bool, int32_t, int64_t, int96, float, double, std::string>;

struct scalar {
    format::Type::type physical_type;
    schema::logical_type::logical_type logical_type;
    scalar_data data;
};

struct value;
struct field;

struct null_value {};

struct list_value {
    std::vector<value> elements;
};

struct map_value {
    std::vector<std::pair<value, value>> entries;
};

// Fields keep the declaration order of the schema.
struct group_value {
    std::vector<field> fields;
    const value* get(std::string_view name) const;
};

struct value {
    std::variant<null_value, scalar, list_value, map_value, group_value> v;

    bool is_null() const { return std::holds_alternative<null_value>(v); }
};

struct field {
    std::string name;
    value data;
};

using row = group_value;

inline const value* group_value::get(std::string_view name) const {
    for (const field& f : fields) {
        if (f.name == name) {
            return &f.data;
        }
    }
    return nullptr;
}

// Renders a value as text: null, quoted strings, minimal numbers, [list], {k -> v}, {name: v}.
// Throws format_error if a scalar payload does not match its declared physical type.
std::string format_value(const value& v);
std::string format_scalar(const scalar& s);

// One text cell per top-level field.
std::vector<std::string> format_row(const row& r);

} // namespace xpq::record
