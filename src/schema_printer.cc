#include <xpq/schema_printer.hh>
#include <seastar/core/print.hh>
#include <sstream>

namespace xpq::schema {

namespace {

const char* repetition_to_string(const format::SchemaElement& x) {
    if (!x.__isset.repetition_type) {
        return "REQUIRED";
    }
    switch (x.repetition_type) {
    case format::FieldRepetitionType::OPTIONAL: return "OPTIONAL";
    case format::FieldRepetitionType::REPEATED: return "REPEATED";
    default: return "REQUIRED";
    }
}

std::string physical_type_to_string(const format::SchemaElement& x) {
    switch (x.type) {
    case format::Type::BOOLEAN: return "BOOLEAN";
    case format::Type::INT32: return "INT32";
    case format::Type::INT64: return "INT64";
    case format::Type::INT96: return "INT96";
    case format::Type::FLOAT: return "FLOAT";
    case format::Type::DOUBLE: return "DOUBLE";
    case format::Type::BYTE_ARRAY: return "BYTE_ARRAY";
    case format::Type::FIXED_LEN_BYTE_ARRAY: return seastar::format("FIXED_LEN_BYTE_ARRAY ({})", x.type_length);
    }
    return seastar::format("UNKNOWN_TYPE_{}", static_cast<int>(x.type));
}

const char* time_unit_to_string(const format::TimeUnit& unit) {
    if (unit.__isset.MILLIS) {
        return "MILLIS";
    } else if (unit.__isset.MICROS) {
        return "MICROS";
    }
    return "NANOS";
}

std::string converted_type_to_string(const format::SchemaElement& x) {
    switch (x.converted_type) {
    case format::ConvertedType::UTF8: return "UTF8";
    case format::ConvertedType::MAP: return "MAP";
    case format::ConvertedType::MAP_KEY_VALUE: return "MAP_KEY_VALUE";
    case format::ConvertedType::LIST: return "LIST";
    case format::ConvertedType::ENUM: return "ENUM";
    case format::ConvertedType::DECIMAL: return seastar::format("DECIMAL({},{})", x.precision, x.scale);
    case format::ConvertedType::DATE: return "DATE";
    case format::ConvertedType::TIME_MILLIS: return "TIME_MILLIS";
    case format::ConvertedType::TIME_MICROS: return "TIME_MICROS";
    case format::ConvertedType::TIMESTAMP_MILLIS: return "TIMESTAMP_MILLIS";
    case format::ConvertedType::TIMESTAMP_MICROS: return "TIMESTAMP_MICROS";
    case format::ConvertedType::UINT_8: return "UINT_8";
    case format::ConvertedType::UINT_16: return "UINT_16";
    case format::ConvertedType::UINT_32: return "UINT_32";
    case format::ConvertedType::UINT_64: return "UINT_64";
    case format::ConvertedType::INT_8: return "INT_8";
    case format::ConvertedType::INT_16: return "INT_16";
    case format::ConvertedType::INT_32: return "INT_32";
    case format::ConvertedType::INT_64: return "INT_64";
    case format::ConvertedType::JSON: return "JSON";
    case format::ConvertedType::BSON: return "BSON";
    case format::ConvertedType::INTERVAL: return "INTERVAL";
    }
    return "";
}

std::string logical_type_to_string(const format::LogicalType& lt) {
    if (lt.__isset.STRING) {
        return "STRING";
    } else if (lt.__isset.MAP) {
        return "MAP";
    } else if (lt.__isset.LIST) {
        return "LIST";
    } else if (lt.__isset.ENUM) {
        return "ENUM";
    } else if (lt.__isset.DECIMAL) {
        return seastar::format("DECIMAL({},{})", lt.DECIMAL.precision, lt.DECIMAL.scale);
    } else if (lt.__isset.DATE) {
        return "DATE";
    } else if (lt.__isset.TIME) {
        return seastar::format("TIME({},{})", time_unit_to_string(lt.TIME.unit), lt.TIME.isAdjustedToUTC);
    } else if (lt.__isset.TIMESTAMP) {
        return seastar::format("TIMESTAMP({},{})",
                time_unit_to_string(lt.TIMESTAMP.unit), lt.TIMESTAMP.isAdjustedToUTC);
    } else if (lt.__isset.INTEGER) {
        return seastar::format("INTEGER({},{})", static_cast<int>(lt.INTEGER.bitWidth), lt.INTEGER.isSigned);
    } else if (lt.__isset.UNKNOWN) {
        return "UNKNOWN";
    } else if (lt.__isset.JSON) {
        return "JSON";
    } else if (lt.__isset.BSON) {
        return "BSON";
    } else if (lt.__isset.UUID) {
        return "UUID";
    }
    return "";
}

class schema_printer {
    std::ostream& _out;
    int _indent_width;
    int _indent = 0;
private:
    void indent() {
        if (_indent > 0) {
            _out << std::string(_indent, ' ');
        }
    }
    void print_annotation(const format::SchemaElement& x) {
        std::string annotation = annotation_to_string(x);
        if (!annotation.empty()) {
            _out << " (" << annotation << ")";
        }
    }
    void print_primitive(const raw_node& node) {
        _out << repetition_to_string(node.info) << " " << physical_type_to_string(node.info) << " " << node.info.name;
        print_annotation(node.info);
        _out << ";\n";
    }
    void print_group(const raw_node& node, bool is_root) {
        if (is_root) {
            _out << "message " << node.info.name << " {\n";
        } else {
            _out << repetition_to_string(node.info) << " group " << node.info.name;
            print_annotation(node.info);
            _out << " {\n";
        }
        _indent += _indent_width;
        for (const raw_node& child : node.children) {
            print(child, false);
        }
        _indent -= _indent_width;
        indent();
        _out << "}\n";
    }
public:
    schema_printer(std::ostream& out, int indent_width)
        : _out(out), _indent_width(indent_width) {}

    void print(const raw_node& node, bool is_root) {
        indent();
        if (is_root || !node.children.empty()) {
            print_group(node, is_root);
        } else {
            print_primitive(node);
        }
    }
};

} // namespace

std::string annotation_to_string(const format::SchemaElement& x) {
    if (x.__isset.converted_type) {
        return converted_type_to_string(x);
    }
    if (x.__isset.logicalType) {
        return logical_type_to_string(x.logicalType);
    }
    return "";
}

void print_schema(const raw_schema& schema, std::ostream& out, int indent_width) {
    schema_printer(out, indent_width).print(schema.root, true);
}

std::string schema_to_string(const raw_schema& schema) {
    std::ostringstream out;
    print_schema(schema, out);
    return out.str();
}

} // namespace xpq::schema
