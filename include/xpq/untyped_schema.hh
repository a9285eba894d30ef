#pragma once

#include <xpq/parquet_types.h>

#include <string>
#include <vector>

namespace xpq::schema {

// The physical schema tree, as declared by the file.
struct raw_node {
    const format::SchemaElement& info;
    std::vector<raw_node> children;
    std::vector<std::string> path;
    uint32_t column_index; // Unused for non-primitive nodes
    uint32_t def_level;
    uint32_t rep_level;
};

struct raw_schema {
    raw_node root;
    std::vector<const raw_node*> leaves;
};

raw_schema flat_schema_to_raw_schema(const std::vector<format::SchemaElement>& flat_schema);

// The dotted path of a node, e.g. "favorite_numbers.array".
std::string path_to_string(const std::vector<std::string>& path);

} // namespace xpq::schema
