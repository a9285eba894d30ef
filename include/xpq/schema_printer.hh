#pragma once

#include <xpq/untyped_schema.hh>
#include <ostream>
#include <string>

namespace xpq::schema {

// Prints the schema in the textual message format:
//
//   message schema {
//     REQUIRED BYTE_ARRAY name (UTF8);
//     OPTIONAL group tags (LIST) {
//       ...
//     }
//   }
void print_schema(const raw_schema& schema, std::ostream& out, int indent_width = 2);
std::string schema_to_string(const raw_schema& schema);

// The type annotation of a node as printed in parentheses, or an empty string.
std::string annotation_to_string(const format::SchemaElement& x);

} // namespace xpq::schema
