#include <xpq/frequency.hh>
#include <xpq/exception.hh>
#include <xpq/overloaded.hh>

#include <seastar/core/print.hh>
#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace xpq {

namespace {

using chain_type = std::vector<const schema::node*>;

// The chain of logical nodes leading to every leaf, indexed by column.
std::vector<chain_type> leaf_chains(const schema::schema& schema) {
    std::vector<chain_type> chains(schema.leaves.size());
    chain_type current;
    auto walk = y_combinator{[&] (auto&& walk, const schema::node& node_variant) -> void {
        current.push_back(&node_variant);
        std::visit(overloaded {
            [&] (const schema::primitive_node& x) { chains.at(x.column_index) = current; },
            [&] (const schema::optional_node& x) { walk(*x.child); },
            [&] (const schema::list_node& x) { walk(*x.element); },
            [&] (const schema::map_node& x) {
                walk(*x.key);
                walk(*x.value);
            },
            [&] (const schema::struct_node& x) {
                for (const schema::node& child : x.fields) {
                    walk(child);
                }
            },
        }, node_variant);
        current.pop_back();
    }};
    for (const schema::node& field : schema.fields) {
        walk(field);
    }
    return chains;
}

bool names_group(const schema::schema& schema, const std::string& path) {
    auto matches = y_combinator{[&] (auto&& matches, const schema::node& node_variant) -> bool {
        return std::visit(overloaded {
            [&] (const schema::primitive_node&) { return false; },
            [&] (const schema::optional_node& x) {
                return boost::iequals(schema::path_to_string(x.path), path) || matches(*x.child);
            },
            [&] (const schema::list_node& x) {
                return boost::iequals(schema::path_to_string(x.path), path) || matches(*x.element);
            },
            [&] (const schema::map_node& x) {
                return boost::iequals(schema::path_to_string(x.path), path) || matches(*x.key) || matches(*x.value);
            },
            [&] (const schema::struct_node& x) {
                if (boost::iequals(schema::path_to_string(x.path), path)) {
                    return true;
                }
                return std::any_of(x.fields.begin(), x.fields.end(), [&] (const schema::node& child) {
                    return matches(child);
                });
            },
        }, node_variant);
    }};
    return std::any_of(schema.fields.begin(), schema.fields.end(), [&] (const schema::node& field) {
        return matches(field);
    });
}

std::string_view unquoted(const std::string& key) {
    if (key.size() >= 2 && key.front() == '"' && key.back() == '"') {
        return std::string_view(key).substr(1, key.size() - 2);
    }
    return key;
}

} // namespace

frequency_counter::frequency_counter(const schema::schema& schema, const std::vector<std::string>& paths) {
    std::vector<chain_type> chains = leaf_chains(schema);
    std::vector<size_t> columns;
    if (paths.empty()) {
        for (size_t i = 0; i < schema.leaves.size(); ++i) {
            columns.push_back(i);
        }
    }
    for (const std::string& path : paths) {
        auto it = std::find_if(schema.leaves.begin(), schema.leaves.end(), [&] (const schema::primitive_node* leaf) {
            return boost::iequals(schema::path_to_string(leaf->path), path);
        });
        if (it == schema.leaves.end()) {
            if (names_group(schema, path)) {
                throw invalid_column(seastar::format("column {} is not a leaf column", path));
            }
            throw invalid_column(seastar::format("column {} does not exist", path));
        }
        size_t column = it - schema.leaves.begin();
        if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
            columns.push_back(column);
        }
    }
    for (size_t column : columns) {
        _routes.push_back(route{schema::path_to_string(schema.leaves[column]->path), std::move(chains[column]), {}});
    }
}

std::vector<size_t> frequency_counter::required_fields(const schema::schema& schema) const {
    std::vector<size_t> fields;
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        bool required = std::any_of(_routes.begin(), _routes.end(), [&] (const route& r) {
            return r.chain.front() == &schema.fields[i];
        });
        if (required) {
            fields.push_back(i);
        }
    }
    return fields;
}

// Optional nodes are transparent in assembled values apart from null. Crossing a
// list or a map yields the list of the values extracted from each element.
record::value frequency_counter::extract(const record::value& v, const chain_type& chain, size_t depth) {
    if (depth + 1 == chain.size() || v.is_null()) {
        return v;
    }
    const schema::node& next = *chain[depth + 1];
    return std::visit(overloaded {
        [&] (const schema::optional_node&) {
            return extract(v, chain, depth + 1);
        },
        [&] (const schema::struct_node&) {
            const auto& group = std::get<record::group_value>(v.v);
            const record::value* child = group.get(schema::name(next));
            if (!child) {
                throw format_error(seastar::format("group value has no field {}", schema::name(next)));
            }
            return extract(*child, chain, depth + 1);
        },
        [&] (const schema::list_node&) {
            record::list_value result;
            for (const record::value& element : std::get<record::list_value>(v.v).elements) {
                result.elements.push_back(extract(element, chain, depth + 1));
            }
            return record::value{std::move(result)};
        },
        [&] (const schema::map_node& x) {
            bool key = &next == x.key.get();
            record::list_value result;
            for (const auto& entry : std::get<record::map_value>(v.v).entries) {
                result.elements.push_back(extract(key ? entry.first : entry.second, chain, depth + 1));
            }
            return record::value{std::move(result)};
        },
        [&] (const schema::primitive_node&) -> record::value {
            throw format_error("a primitive node has no children");
        },
    }, *chain[depth]);
}

void frequency_counter::add(const record::row& r) {
    for (route& rt : _routes) {
        const record::value* top = r.get(schema::name(*rt.chain.front()));
        if (!top) {
            throw format_error(seastar::format("row has no field {}", schema::name(*rt.chain.front())));
        }
        ++rt.counts[record::format_value(extract(*top, rt.chain, 0))];
    }
}

std::vector<column_frequencies> frequency_counter::results() const {
    std::vector<column_frequencies> results;
    results.reserve(_routes.size());
    for (const route& rt : _routes) {
        column_frequencies cf{rt.column, {rt.counts.begin(), rt.counts.end()}};
        sort_frequencies(cf.counts);
        results.push_back(std::move(cf));
    }
    return results;
}

void sort_frequencies(std::vector<std::pair<std::string, uint64_t>>& counts) {
    std::sort(counts.begin(), counts.end(), [] (const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        std::string_view ua = unquoted(a.first);
        std::string_view ub = unquoted(b.first);
        if (ua != ub) {
            return ua < ub;
        }
        return a.first < b.first;
    });
}

} // namespace xpq
