#pragma once

#include <xpq/schema.hh>
#include <xpq/value.hh>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xpq {

struct column_frequencies {
    std::string column;
    // Descending count; equal counts in ascending order of the unquoted key text.
    std::vector<std::pair<std::string, uint64_t>> counts;
};

// Counts the formatted values of leaf columns over a stream of rows.
class frequency_counter {
    struct route {
        std::string column;
        // From a top-level field down to the leaf.
        std::vector<const schema::node*> chain;
        std::unordered_map<std::string, uint64_t> counts;
    };
    std::vector<route> _routes;
private:
    static record::value extract(const record::value& v, const std::vector<const schema::node*>& chain, size_t depth);
public:
    // paths are dotted leaf paths, matched ignoring case. An empty list selects every leaf.
    // Throws invalid_column for an unknown path or a path that does not name a leaf.
    frequency_counter(const schema::schema& schema, const std::vector<std::string>& paths);

    // Indices of the top-level fields the rows passed to add must carry.
    std::vector<size_t> required_fields(const schema::schema& schema) const;
    void add(const record::row& r);
    std::vector<column_frequencies> results() const;
};

// Orders (key, count) pairs by descending count. Ties compare the key text with the
// quotes of a quoted string removed, then the full key text.
void sort_frequencies(std::vector<std::pair<std::string, uint64_t>>& counts);

// Feeds up to limit rows of source into counter.
template <typename Source>
std::vector<column_frequencies> count_frequencies(
        Source& source, frequency_counter& counter, std::optional<uint64_t> limit = std::nullopt) {
    uint64_t rows = 0;
    while (!limit || rows < *limit) {
        auto row = source.read_one();
        if (!row) {
            break;
        }
        counter.add(*row);
        ++rows;
    }
    return counter.results();
}

} // namespace xpq
