#include <xpq/schema.hh>
#include <xpq/exception.hh>
#include <xpq/overloaded.hh>
#include <seastar/core/print.hh>
#include <optional>

namespace xpq::schema {

namespace {

void verify(bool condition, const format::SchemaElement& x, const char* error) {
    if (!condition) {
        throw metadata_error(seastar::format("invalid type annotation of {}: {}", x.name, error));
    }
}

logical_type::logical_type decimal_type(const format::SchemaElement& x, int32_t scale, int32_t precision) {
    verify(scale >= 0 && scale <= precision, x, "DECIMAL scale must be between 0 and precision");
    if (x.type == format::Type::INT32) {
        verify(1 <= precision && precision <= 9, x, "precision out of bounds for INT32 decimal");
        return logical_type::DECIMAL_INT32{scale, precision};
    } else if (x.type == format::Type::INT64) {
        verify(1 <= precision && precision <= 18, x, "precision out of bounds for INT64 decimal");
        return logical_type::DECIMAL_INT64{scale, precision};
    } else if (x.type == format::Type::BYTE_ARRAY) {
        verify(precision > 0, x, "precision out of bounds for BYTE_ARRAY decimal");
        return logical_type::DECIMAL_BYTE_ARRAY{scale, precision};
    } else if (x.type == format::Type::FIXED_LEN_BYTE_ARRAY) {
        verify(precision > 0, x, "precision out of bounds for FIXED_LEN_BYTE_ARRAY decimal");
        return logical_type::DECIMAL_FIXED_LEN_BYTE_ARRAY{scale, precision};
    }
    verify(false, x, "DECIMAL must annotate INT32, INT64, BYTE_ARRAY or FIXED_LEN_BYTE_ARRAY");
    return logical_type::UNKNOWN{}; // Unreachable
}

bool is_binary(const format::SchemaElement& x) {
    return x.type == format::Type::BYTE_ARRAY || x.type == format::Type::FIXED_LEN_BYTE_ARRAY;
}

// The logicalType field supersedes converted_type when both are present.
std::optional<logical_type::logical_type> from_logical_type(const format::SchemaElement& x) {
    const format::LogicalType& lt = x.logicalType;
    if (lt.__isset.STRING) {
        verify(is_binary(x), x, "STRING must annotate the binary physical type");
        return logical_type::STRING{};
    } else if (lt.__isset.ENUM) {
        verify(is_binary(x), x, "ENUM must annotate the binary physical type");
        return logical_type::ENUM{};
    } else if (lt.__isset.JSON) {
        verify(is_binary(x), x, "JSON must annotate the binary physical type");
        return logical_type::JSON{};
    } else if (lt.__isset.BSON) {
        verify(is_binary(x), x, "BSON must annotate the binary physical type");
        return logical_type::BSON{};
    } else if (lt.__isset.UUID) {
        verify(x.type == format::Type::FIXED_LEN_BYTE_ARRAY && x.type_length == 16,
               x, "UUID must annotate the 16-byte fixed-length binary type");
        return logical_type::UUID{};
    } else if (lt.__isset.DATE) {
        verify(x.type == format::Type::INT32, x, "DATE must annotate the INT32 physical type");
        return logical_type::DATE{};
    } else if (lt.__isset.DECIMAL) {
        return decimal_type(x, lt.DECIMAL.scale, lt.DECIMAL.precision);
    } else if (lt.__isset.TIME) {
        if (lt.TIME.unit.__isset.MILLIS) {
            verify(x.type == format::Type::INT32, x, "TIME MILLIS must annotate the INT32 physical type");
            return logical_type::TIME_INT32{lt.TIME.isAdjustedToUTC};
        } else if (lt.TIME.unit.__isset.MICROS) {
            verify(x.type == format::Type::INT64, x, "TIME MICROS must annotate the INT64 physical type");
            return logical_type::TIME_INT64{lt.TIME.isAdjustedToUTC, logical_type::TIME_INT64::MICROS};
        } else if (lt.TIME.unit.__isset.NANOS) {
            verify(x.type == format::Type::INT64, x, "TIME NANOS must annotate the INT64 physical type");
            return logical_type::TIME_INT64{lt.TIME.isAdjustedToUTC, logical_type::TIME_INT64::NANOS};
        }
    } else if (lt.__isset.TIMESTAMP) {
        verify(x.type == format::Type::INT64, x, "TIMESTAMP must annotate the INT64 physical type");
        if (lt.TIMESTAMP.unit.__isset.MILLIS) {
            return logical_type::TIMESTAMP{lt.TIMESTAMP.isAdjustedToUTC, logical_type::TIMESTAMP::MILLIS};
        } else if (lt.TIMESTAMP.unit.__isset.MICROS) {
            return logical_type::TIMESTAMP{lt.TIMESTAMP.isAdjustedToUTC, logical_type::TIMESTAMP::MICROS};
        } else if (lt.TIMESTAMP.unit.__isset.NANOS) {
            return logical_type::TIMESTAMP{lt.TIMESTAMP.isAdjustedToUTC, logical_type::TIMESTAMP::NANOS};
        }
    } else if (lt.__isset.INTEGER) {
        int width = lt.INTEGER.bitWidth;
        bool is_signed = lt.INTEGER.isSigned;
        if (width == 64) {
            verify(x.type == format::Type::INT64, x, "64-bit INTEGER must annotate the INT64 physical type");
            return is_signed ? logical_type::logical_type{logical_type::INT64{}} : logical_type::UINT64{};
        }
        verify(x.type == format::Type::INT32, x, "INTEGER narrower than 64 bits must annotate the INT32 physical type");
        switch (width) {
        case 8: return is_signed ? logical_type::logical_type{logical_type::INT8{}} : logical_type::UINT8{};
        case 16: return is_signed ? logical_type::logical_type{logical_type::INT16{}} : logical_type::UINT16{};
        case 32: return is_signed ? logical_type::logical_type{logical_type::INT32{}} : logical_type::UINT32{};
        default: verify(false, x, "INTEGER bit width must be 8, 16, 32 or 64");
        }
    } else if (lt.__isset.UNKNOWN) {
        return logical_type::UNKNOWN{};
    }
    return std::nullopt;
}

std::optional<logical_type::logical_type> from_converted_type(const format::SchemaElement& x) {
    switch (x.converted_type) {
    case format::ConvertedType::UTF8:
        verify(is_binary(x), x, "UTF8 must annotate the binary physical type");
        return logical_type::STRING{};
    case format::ConvertedType::ENUM:
        verify(is_binary(x), x, "ENUM must annotate the binary physical type");
        return logical_type::ENUM{};
    case format::ConvertedType::INT_8:
        verify(x.type == format::Type::INT32, x, "INT_8 must annotate the INT32 physical type");
        return logical_type::INT8{};
    case format::ConvertedType::INT_16:
        verify(x.type == format::Type::INT32, x, "INT_16 must annotate the INT32 physical type");
        return logical_type::INT16{};
    case format::ConvertedType::INT_32:
        verify(x.type == format::Type::INT32, x, "INT_32 must annotate the INT32 physical type");
        return logical_type::INT32{};
    case format::ConvertedType::INT_64:
        verify(x.type == format::Type::INT64, x, "INT_64 must annotate the INT64 physical type");
        return logical_type::INT64{};
    case format::ConvertedType::UINT_8:
        verify(x.type == format::Type::INT32, x, "UINT_8 must annotate the INT32 physical type");
        return logical_type::UINT8{};
    case format::ConvertedType::UINT_16:
        verify(x.type == format::Type::INT32, x, "UINT_16 must annotate the INT32 physical type");
        return logical_type::UINT16{};
    case format::ConvertedType::UINT_32:
        verify(x.type == format::Type::INT32, x, "UINT_32 must annotate the INT32 physical type");
        return logical_type::UINT32{};
    case format::ConvertedType::UINT_64:
        verify(x.type == format::Type::INT64, x, "UINT_64 must annotate the INT64 physical type");
        return logical_type::UINT64{};
    case format::ConvertedType::DECIMAL:
        verify(x.__isset.precision && x.__isset.scale, x, "precision and scale must be set for DECIMAL");
        return decimal_type(x, x.scale, x.precision);
    case format::ConvertedType::DATE:
        verify(x.type == format::Type::INT32, x, "DATE must annotate the INT32 physical type");
        return logical_type::DATE{};
    case format::ConvertedType::TIME_MILLIS:
        verify(x.type == format::Type::INT32, x, "TIME_MILLIS must annotate the INT32 physical type");
        return logical_type::TIME_INT32{true};
    case format::ConvertedType::TIME_MICROS:
        verify(x.type == format::Type::INT64, x, "TIME_MICROS must annotate the INT64 physical type");
        return logical_type::TIME_INT64{true, logical_type::TIME_INT64::MICROS};
    case format::ConvertedType::TIMESTAMP_MILLIS:
        verify(x.type == format::Type::INT64, x, "TIMESTAMP_MILLIS must annotate the INT64 physical type");
        return logical_type::TIMESTAMP{true, logical_type::TIMESTAMP::MILLIS};
    case format::ConvertedType::TIMESTAMP_MICROS:
        verify(x.type == format::Type::INT64, x, "TIMESTAMP_MICROS must annotate the INT64 physical type");
        return logical_type::TIMESTAMP{true, logical_type::TIMESTAMP::MICROS};
    case format::ConvertedType::INTERVAL:
        verify(x.type == format::Type::FIXED_LEN_BYTE_ARRAY && x.type_length == 12,
               x, "INTERVAL must annotate the 12-byte fixed-length binary type");
        return logical_type::INTERVAL{};
    case format::ConvertedType::JSON:
        verify(is_binary(x), x, "JSON must annotate the binary physical type");
        return logical_type::JSON{};
    case format::ConvertedType::BSON:
        verify(is_binary(x), x, "BSON must annotate the binary physical type");
        return logical_type::BSON{};
    default:
        return std::nullopt;
    }
}

primitive_node build_primitive_node(const raw_node& r) {
    return primitive_node{
            {r.info, r.path, static_cast<int>(r.def_level), static_cast<int>(r.rep_level)},
            determine_logical_type(r.info),
            static_cast<int>(r.column_index)};
}

node build_logical_node(const raw_node& r);
node build_unwrapped_node(const raw_node& r);

// The repeated child of a LIST group carries the levels of the list itself.
// In the legacy 2-level layout the repeated child is the element; in the standard
// 3-level layout the element is the only child of the repeated group.
list_node build_list_node(const raw_node& r) {
    if (r.children.size() != 1 || r.info.repetition_type == format::FieldRepetitionType::REPEATED) {
        throw metadata_error(seastar::format("invalid LIST group {}", path_to_string(r.path)));
    }
    const raw_node& repeated_node = r.children[0];
    if (repeated_node.info.repetition_type != format::FieldRepetitionType::REPEATED) {
        throw metadata_error(seastar::format("invalid LIST group {}: its child is not repeated", path_to_string(r.path)));
    }
    node_base levels{r.info, r.path,
            static_cast<int>(repeated_node.def_level) - 1, static_cast<int>(repeated_node.rep_level) - 1};

    if ((repeated_node.children.size() != 1)
        || (repeated_node.info.name == "array")
        || (repeated_node.info.name == (r.info.name + "_tuple"))) {
        return list_node{std::move(levels), std::make_unique<node>(build_unwrapped_node(repeated_node))};
    } else {
        const raw_node& element_node = repeated_node.children[0];
        return list_node{std::move(levels), std::make_unique<node>(build_logical_node(element_node))};
    }
}

map_node build_map_node(const raw_node& r) {
    if (r.children.size() != 1) {
        throw metadata_error(seastar::format("invalid MAP group {}", path_to_string(r.path)));
    }
    const raw_node& repeated_node = r.children[0];
    if (repeated_node.children.size() != 2
        || repeated_node.info.repetition_type != format::FieldRepetitionType::REPEATED) {
        throw metadata_error(seastar::format(
                "invalid MAP group {}: expected a repeated key_value group", path_to_string(r.path)));
    }
    const raw_node& key_node = repeated_node.children[0];
    const raw_node& value_node = repeated_node.children[1];
    if (!key_node.children.empty()) {
        throw metadata_error(seastar::format("invalid MAP group {}: the key is not primitive", path_to_string(r.path)));
    }
    return map_node{
            {r.info, r.path, static_cast<int>(repeated_node.def_level) - 1, static_cast<int>(repeated_node.rep_level) - 1},
            std::make_unique<node>(build_logical_node(key_node)),
            std::make_unique<node>(build_logical_node(value_node))};
}

struct_node build_struct_node(const raw_node& r) {
    std::vector<node> fields;
    fields.reserve(r.children.size());
    for (const raw_node& child : r.children) {
        fields.push_back(build_logical_node(child));
    }
    return struct_node{{r.info, r.path, static_cast<int>(r.def_level), static_cast<int>(r.rep_level)}, std::move(fields)};
}

enum class node_type { MAP, LIST, STRUCT, PRIMITIVE };
node_type determine_node_type(const raw_node& r) {
    if (r.children.empty()) {
        return node_type::PRIMITIVE;
    }
    const format::SchemaElement& x = r.info;
    if (x.__isset.logicalType) {
        if (x.logicalType.__isset.MAP) {
            return node_type::MAP;
        } else if (x.logicalType.__isset.LIST) {
            return node_type::LIST;
        }
    }
    if (x.__isset.converted_type) {
        if (x.converted_type == format::ConvertedType::MAP) {
            return node_type::MAP;
        } else if (x.converted_type == format::ConvertedType::MAP_KEY_VALUE
                && x.repetition_type != format::FieldRepetitionType::REPEATED) {
            return node_type::MAP;
        } else if (x.converted_type == format::ConvertedType::LIST) {
            return node_type::LIST;
        }
    }
    return node_type::STRUCT;
}

node build_unwrapped_node(const raw_node& r) {
    switch (determine_node_type(r)) {
    case node_type::MAP: return build_map_node(r);
    case node_type::LIST: return build_list_node(r);
    case node_type::STRUCT: return build_struct_node(r);
    case node_type::PRIMITIVE: return build_primitive_node(r);
    }
    throw metadata_error("unknown node type"); // Unreachable
}

node build_logical_node(const raw_node& r) {
    if (r.info.repetition_type == format::FieldRepetitionType::OPTIONAL) {
        return optional_node{
                {r.info, r.path, static_cast<int>(r.def_level) - 1, static_cast<int>(r.rep_level)},
                std::make_unique<node>(build_unwrapped_node(r))};
    } else if (r.info.repetition_type == format::FieldRepetitionType::REPEATED) {
        return list_node{
                {r.info, r.path, static_cast<int>(r.def_level) - 1, static_cast<int>(r.rep_level) - 1},
                std::make_unique<node>(build_unwrapped_node(r))};
    } else {
        return build_unwrapped_node(r);
    }
}

void compute_leaves(schema& root) {
    auto collect = y_combinator{[&] (auto&& collect, const node& x_variant) -> void {
        std::visit(overloaded {
            [&] (const optional_node& x) { collect(*x.child); },
            [&] (const list_node& x) { collect(*x.element); },
            [&] (const map_node& x) {
                collect(*x.key);
                collect(*x.value);
            },
            [&] (const struct_node& x) {
                for (const node& child : x.fields) {
                    collect(child);
                }
            },
            [&] (const primitive_node& y) {
                root.leaves.push_back(&y);
            }
        }, x_variant);
    }};
    for (const node& field : root.fields) {
        collect(field);
    }
}

} // namespace

logical_type::logical_type determine_logical_type(const format::SchemaElement& x) {
    if (!x.__isset.type) {
        return logical_type::UNKNOWN{};
    }
    if (x.__isset.logicalType) {
        if (auto lt = from_logical_type(x)) {
            return *lt;
        }
    }
    if (x.__isset.converted_type) {
        if (auto lt = from_converted_type(x)) {
            return *lt;
        }
    }
    switch (x.type) {
    case format::Type::BOOLEAN: return logical_type::BOOLEAN{};
    case format::Type::INT32: return logical_type::INT32{};
    case format::Type::INT64: return logical_type::INT64{};
    case format::Type::INT96: return logical_type::INT96{};
    case format::Type::FLOAT: return logical_type::FLOAT{};
    case format::Type::DOUBLE: return logical_type::DOUBLE{};
    case format::Type::BYTE_ARRAY: return logical_type::BYTE_ARRAY{};
    case format::Type::FIXED_LEN_BYTE_ARRAY: return logical_type::FIXED_LEN_BYTE_ARRAY{};
    }
    throw metadata_error(seastar::format("unknown physical type {} of {}", static_cast<int>(x.type), x.name));
}

schema raw_schema_to_schema(const raw_schema& raw_schema) {
    std::vector<node> fields;
    fields.reserve(raw_schema.root.children.size());
    for (const raw_node& child : raw_schema.root.children) {
        fields.push_back(build_logical_node(child));
    }
    schema root{raw_schema.root.info, std::move(fields)};
    compute_leaves(root);
    return root;
}

const node_base& base(const node& n) {
    return std::visit([] (const auto& x) -> const node_base& { return x; }, n);
}

} // namespace xpq::schema
