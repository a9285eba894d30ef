#pragma once

#include <xpq/schema.hh>
#include <xpq/value.hh>

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace xpq::record {

struct triplet {
    int16_t def_level;
    int16_t rep_level;
    // Present iff def_level is the maximum definition level of the column.
    std::optional<scalar_data> value;
};

// A column chunk seen as a sequence of (definition level, repetition level, value) triplets.
class column_source {
public:
    virtual ~column_source() = default;
    // Returns false after the last triplet.
    virtual bool next(triplet& out) = 0;
    // Releases the underlying resources. next() returns false afterwards.
    virtual void close() {}
};

using column_source_factory = std::function<std::unique_ptr<column_source>(const schema::primitive_node&)>;

class field_reader;

class primitive_reader {
    const schema::primitive_node& _node;
    std::unique_ptr<column_source> _source;
    int _row_group;
    triplet _current;
    bool _eof = false;
private:
    void advance();
public:
    primitive_reader(const schema::primitive_node& node, std::unique_ptr<column_source> source, int row_group);
    value read_field();
    void skip_field();
    std::pair<int, int> current_levels() const;
    void close();
};

class optional_reader {
    const schema::optional_node& _node;
    std::unique_ptr<field_reader> _child;
public:
    optional_reader(const schema::optional_node& node, std::unique_ptr<field_reader> child)
        : _node{node}, _child{std::move(child)} {}
    value read_field();
    void skip_field();
    std::pair<int, int> current_levels() const;
    void close();
};

class struct_reader {
    const schema::struct_node& _node;
    std::vector<field_reader> _readers;
    int _row_group;
private:
    void check_children() const;
public:
    struct_reader(const schema::struct_node& node, std::vector<field_reader> readers, int row_group);
    value read_field();
    void skip_field();
    std::pair<int, int> current_levels() const;
    void close();
};

class list_reader {
    const schema::list_node& _node;
    std::unique_ptr<field_reader> _element;
public:
    list_reader(const schema::list_node& node, std::unique_ptr<field_reader> element)
        : _node{node}, _element{std::move(element)} {}
    value read_field();
    void skip_field();
    std::pair<int, int> current_levels() const;
    void close();
};

class map_reader {
    const schema::map_node& _node;
    std::unique_ptr<field_reader> _key;
    std::unique_ptr<field_reader> _value;
    int _row_group;
private:
    void check_entries() const;
public:
    map_reader(const schema::map_node& node, std::unique_ptr<field_reader> key, std::unique_ptr<field_reader> value,
            int row_group)
        : _node{node}, _key{std::move(key)}, _value{std::move(value)}, _row_group{row_group} {}
    value read_field();
    void skip_field();
    std::pair<int, int> current_levels() const;
    void close();
};

// Reads one logical field of the schema tree. Each read_field or skip_field call
// consumes exactly the triplets of one occurrence of the field in every leaf below it.
// current_levels is (-1, -1) once the underlying columns are exhausted.
class field_reader {
    std::variant<primitive_reader, optional_reader, struct_reader, list_reader, map_reader> _reader;
public:
    template <typename Reader>
    explicit field_reader(Reader reader) : _reader{std::move(reader)} {}

    static field_reader make(const schema::node& node, const column_source_factory& sources, int row_group);

    value read_field() {
        return std::visit([] (auto& x) { return x.read_field(); }, _reader);
    }
    void skip_field() {
        std::visit([] (auto& x) { x.skip_field(); }, _reader);
    }
    std::pair<int, int> current_levels() const {
        return std::visit([] (const auto& x) { return x.current_levels(); }, _reader);
    }
    void close() {
        std::visit([] (auto& x) { x.close(); }, _reader);
    }
};

// Assembles the rows of one row group from its column chunks.
class record_reader {
    std::vector<std::string> _names;
    std::vector<field_reader> _readers;
    int _row_group;
    int64_t _num_rows;
    int64_t _rows_read = 0;
private:
    record_reader(std::vector<std::string> names, std::vector<field_reader> readers, int row_group, int64_t num_rows)
        : _names{std::move(names)}, _readers{std::move(readers)}, _row_group{row_group}, _num_rows{num_rows} {}
public:
    // Only the top-level fields whose indices are given in selected are assembled,
    // and only their leaves are requested from the factory.
    static record_reader make(
            const schema::schema& schema,
            int row_group,
            int64_t num_rows,
            const column_source_factory& sources,
            const std::vector<size_t>& selected);

    // Returns std::nullopt after the last row. Throws assembly_error if the columns
    // do not hold exactly num_rows records.
    std::optional<row> read_one();
    int64_t rows_read() const { return _rows_read; }
    void close();
};

} // namespace xpq::record
