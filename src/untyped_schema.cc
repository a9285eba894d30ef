#include <xpq/untyped_schema.hh>
#include <xpq/exception.hh>
#include <xpq/overloaded.hh>
#include <seastar/core/print.hh>

namespace xpq::schema {

namespace {

// Thrift has no recursive structures, so the schema tree is stored in preorder
// as a flat vector. The shape is recovered from num_children.
raw_schema compute_shape(const std::vector<format::SchemaElement>& flat_schema) {
    if (flat_schema.empty()) {
        throw metadata_error("could not build schema tree: empty schema");
    }
    size_t index = 0;
    raw_node root = y_combinator{[&] (auto&& convert, bool is_root) -> raw_node {
        if (index >= flat_schema.size()) {
            throw metadata_error("could not build schema tree: unexpected end of flat schema");
        }
        const format::SchemaElement& current = flat_schema[index];
        ++index;
        if (current.__isset.num_children && current.num_children < 0) {
            throw metadata_error(seastar::format(
                    "could not build schema tree: negative num_children for {}", current.name));
        }
        if (is_root || (current.__isset.num_children && current.num_children > 0)) {
            std::vector<raw_node> children;
            children.reserve(current.num_children);
            for (int i = 0; i < current.num_children; ++i) {
                children.push_back(convert(false));
            }
            return raw_node{current, std::move(children)};
        }
        if (!current.__isset.type) {
            throw metadata_error(seastar::format(
                    "could not build schema tree: leaf {} has no physical type", current.name));
        }
        return raw_node{current, std::vector<raw_node>()};
    }}(true);
    if (index != flat_schema.size()) {
        throw metadata_error(seastar::format(
                "could not build schema tree: {} schema elements left after the root", flat_schema.size() - index));
    }
    return {std::move(root)};
}

// Assign the column_index to each primitive (leaf) node of the schema.
void compute_leaves(raw_schema& raw_schema) {
    auto compute = y_combinator{[&] (auto&& compute, raw_node& r) -> void {
        if (r.children.empty()) {
            r.column_index = raw_schema.leaves.size();
            raw_schema.leaves.push_back(&r);
        } else {
            r.column_index = -1;
            for (raw_node& child : r.children) {
                compute(child);
            }
        }
    }};
    raw_schema.root.column_index = -1;
    for (raw_node& child : raw_schema.root.children) {
        compute(child);
    }
}

// The repetition of the root is ignored.
void compute_levels(raw_schema& raw_schema) {
    auto compute = y_combinator{[&] (auto&& compute, raw_node& r, uint32_t def, uint32_t rep) -> void {
        if (r.info.repetition_type == format::FieldRepetitionType::REPEATED) {
            ++def;
            ++rep;
        } else if (r.info.repetition_type == format::FieldRepetitionType::OPTIONAL) {
            ++def;
        }
        r.def_level = def;
        r.rep_level = rep;
        for (raw_node& child : r.children) {
            compute(child, def, rep);
        }
    }};
    raw_schema.root.def_level = 0;
    raw_schema.root.rep_level = 0;
    for (raw_node& child : raw_schema.root.children) {
        compute(child, 0, 0);
    }
}

void compute_path(raw_schema& raw_schema) {
    auto compute = y_combinator{[&] (auto&& compute, raw_node& r, std::vector<std::string> path) -> void {
        path.push_back(r.info.name);
        for (raw_node& child : r.children) {
            compute(child, path);
        }
        r.path = std::move(path);
    }};
    for (raw_node& child : raw_schema.root.children) {
        compute(child, std::vector<std::string>());
    }
}

} // namespace

raw_schema flat_schema_to_raw_schema(const std::vector<format::SchemaElement>& flat_schema) {
    raw_schema raw_schema = compute_shape(flat_schema);
    compute_leaves(raw_schema);
    compute_levels(raw_schema);
    compute_path(raw_schema);
    return raw_schema;
}

std::string path_to_string(const std::vector<std::string>& path) {
    std::string result;
    for (const std::string& part : path) {
        if (!result.empty()) {
            result += '.';
        }
        result += part;
    }
    return result;
}

} // namespace xpq::schema
