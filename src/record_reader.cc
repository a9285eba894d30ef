#include <xpq/record_reader.hh>
#include <xpq/exception.hh>
#include <xpq/overloaded.hh>

#include <seastar/core/print.hh>

#include <algorithm>

namespace xpq::record {

namespace {

// Leaves below a common group must agree on where each occurrence of the group starts:
// the same repetition level, and the same definition level up to the level of the group.
void check_aligned(std::pair<int, int> first, std::pair<int, int> other, int group_def_level,
        const std::vector<std::string>& path, int row_group) {
    auto clamp = [group_def_level] (std::pair<int, int> levels) {
        return std::make_pair(std::min(levels.first, group_def_level), levels.second);
    };
    if (clamp(first) != clamp(other)) {
        throw assembly_error(row_group, seastar::format(
                "columns of {} disagree on record boundaries (levels ({}, {}) and ({}, {}))",
                schema::path_to_string(path), first.first, first.second, other.first, other.second));
    }
}

} // namespace

primitive_reader::primitive_reader(
        const schema::primitive_node& node, std::unique_ptr<column_source> source, int row_group)
    : _node{node}
    , _source{std::move(source)}
    , _row_group{row_group} {
    advance();
}

void primitive_reader::advance() {
    if (!_source->next(_current)) {
        _eof = true;
        return;
    }
    if (_current.def_level < 0 || _current.def_level > _node.def_level) {
        throw assembly_error(_row_group, seastar::format(
                "column {}: definition level {} out of range [0, {}]",
                schema::path_to_string(_node.path), _current.def_level, _node.def_level));
    }
    if (_current.rep_level < 0 || _current.rep_level > _node.rep_level) {
        throw assembly_error(_row_group, seastar::format(
                "column {}: repetition level {} out of range [0, {}]",
                schema::path_to_string(_node.path), _current.rep_level, _node.rep_level));
    }
    bool defined = _current.def_level == _node.def_level;
    if (defined && !_current.value) {
        throw assembly_error(_row_group, seastar::format(
                "column {}: missing value at definition level {}",
                schema::path_to_string(_node.path), _current.def_level));
    } else if (!defined && _current.value) {
        throw assembly_error(_row_group, seastar::format(
                "column {}: value present at definition level {}, below the maximum",
                schema::path_to_string(_node.path), _current.def_level));
    }
}

value primitive_reader::read_field() {
    if (_eof) {
        throw assembly_error(_row_group, seastar::format(
                "column {} ended in the middle of a record", schema::path_to_string(_node.path)));
    }
    if (!_current.value) {
        throw assembly_error(_row_group, seastar::format(
                "column {}: required value is undefined (definition level {})",
                schema::path_to_string(_node.path), _current.def_level));
    }
    value v{scalar{_node.info.type, _node.logical_type, std::move(*_current.value)}};
    advance();
    return v;
}

void primitive_reader::skip_field() {
    if (_eof) {
        throw assembly_error(_row_group, seastar::format(
                "column {} ended in the middle of a record", schema::path_to_string(_node.path)));
    }
    advance();
}

std::pair<int, int> primitive_reader::current_levels() const {
    if (_eof) {
        return {-1, -1};
    }
    return {_current.def_level, _current.rep_level};
}

void primitive_reader::close() {
    _source->close();
}

value optional_reader::read_field() {
    if (_child->current_levels().first > _node.def_level) {
        return _child->read_field();
    }
    _child->skip_field();
    return value{null_value{}};
}

void optional_reader::skip_field() {
    _child->skip_field();
}

std::pair<int, int> optional_reader::current_levels() const {
    return _child->current_levels();
}

void optional_reader::close() {
    _child->close();
}

struct_reader::struct_reader(const schema::struct_node& node, std::vector<field_reader> readers, int row_group)
    : _node{node}
    , _readers{std::move(readers)}
    , _row_group{row_group} {}

void struct_reader::check_children() const {
    for (size_t i = 1; i < _readers.size(); ++i) {
        check_aligned(_readers[0].current_levels(), _readers[i].current_levels(),
                _node.def_level, _node.path, _row_group);
    }
}

value struct_reader::read_field() {
    check_children();
    group_value group;
    group.fields.reserve(_readers.size());
    for (size_t i = 0; i < _readers.size(); ++i) {
        group.fields.push_back(field{schema::name(_node.fields[i]), _readers[i].read_field()});
    }
    check_children();
    return value{std::move(group)};
}

void struct_reader::skip_field() {
    check_children();
    for (field_reader& reader : _readers) {
        reader.skip_field();
    }
    check_children();
}

// Children are checked to agree after every occurrence, so the first one speaks for them.
std::pair<int, int> struct_reader::current_levels() const {
    return _readers[0].current_levels();
}

void struct_reader::close() {
    for (field_reader& reader : _readers) {
        reader.close();
    }
}

value list_reader::read_field() {
    list_value list;
    if (_element->current_levels().first > _node.def_level) {
        do {
            list.elements.push_back(_element->read_field());
        } while (_element->current_levels().second > _node.rep_level);
    } else {
        _element->skip_field();
    }
    return value{std::move(list)};
}

void list_reader::skip_field() {
    _element->skip_field();
}

std::pair<int, int> list_reader::current_levels() const {
    return _element->current_levels();
}

void list_reader::close() {
    _element->close();
}

// The key_value group sits one definition level above the map.
void map_reader::check_entries() const {
    check_aligned(_key->current_levels(), _value->current_levels(), _node.def_level + 1, _node.path, _row_group);
}

value map_reader::read_field() {
    map_value map;
    check_entries();
    if (_key->current_levels().first > _node.def_level) {
        do {
            value k = _key->read_field();
            value v = _value->read_field();
            map.entries.emplace_back(std::move(k), std::move(v));
            check_entries();
        } while (_key->current_levels().second > _node.rep_level);
    } else {
        _key->skip_field();
        _value->skip_field();
        check_entries();
    }
    return value{std::move(map)};
}

void map_reader::skip_field() {
    check_entries();
    _key->skip_field();
    _value->skip_field();
    check_entries();
}

std::pair<int, int> map_reader::current_levels() const {
    return _key->current_levels();
}

void map_reader::close() {
    _key->close();
    _value->close();
}

field_reader field_reader::make(const schema::node& node_variant, const column_source_factory& sources, int row_group) {
    return std::visit(overloaded {
        [&] (const schema::primitive_node& node) {
            return field_reader{primitive_reader{node, sources(node), row_group}};
        },
        [&] (const schema::optional_node& node) {
            return field_reader{optional_reader{
                    node, std::make_unique<field_reader>(field_reader::make(*node.child, sources, row_group))}};
        },
        [&] (const schema::list_node& node) {
            return field_reader{list_reader{
                    node, std::make_unique<field_reader>(field_reader::make(*node.element, sources, row_group))}};
        },
        [&] (const schema::map_node& node) {
            auto key = std::make_unique<field_reader>(field_reader::make(*node.key, sources, row_group));
            auto value = std::make_unique<field_reader>(field_reader::make(*node.value, sources, row_group));
            return field_reader{map_reader{node, std::move(key), std::move(value), row_group}};
        },
        [&] (const schema::struct_node& node) {
            std::vector<field_reader> readers;
            readers.reserve(node.fields.size());
            for (const schema::node& child : node.fields) {
                readers.push_back(field_reader::make(child, sources, row_group));
            }
            return field_reader{struct_reader{node, std::move(readers), row_group}};
        }
    }, node_variant);
}

record_reader record_reader::make(
        const schema::schema& schema,
        int row_group,
        int64_t num_rows,
        const column_source_factory& sources,
        const std::vector<size_t>& selected) {
    if (num_rows < 0) {
        throw metadata_error(seastar::format("row group {} declares a negative number of rows", row_group));
    }
    std::vector<std::string> names;
    std::vector<field_reader> readers;
    names.reserve(selected.size());
    readers.reserve(selected.size());
    for (size_t i : selected) {
        const schema::node& field_node = schema.fields.at(i);
        names.push_back(schema::name(field_node));
        readers.push_back(field_reader::make(field_node, sources, row_group));
    }
    return record_reader{std::move(names), std::move(readers), row_group, num_rows};
}

std::optional<row> record_reader::read_one() {
    if (_rows_read == _num_rows) {
        for (const field_reader& reader : _readers) {
            if (reader.current_levels().first != -1) {
                throw assembly_error(_row_group, seastar::format(
                        "columns hold more records than the {} declared", _num_rows));
            }
        }
        return std::nullopt;
    }
    row r;
    r.fields.reserve(_readers.size());
    for (size_t i = 0; i < _readers.size(); ++i) {
        auto [def, rep] = _readers[i].current_levels();
        if (def == -1) {
            throw assembly_error(_row_group, seastar::format(
                    "columns hold {} records, but {} were declared", _rows_read, _num_rows));
        }
        if (rep != 0) {
            throw assembly_error(_row_group, seastar::format(
                    "record {} starts at repetition level {}", _rows_read, rep));
        }
        r.fields.push_back(field{_names[i], _readers[i].read_field()});
    }
    ++_rows_read;
    return r;
}

void record_reader::close() {
    for (field_reader& reader : _readers) {
        reader.close();
    }
}

} // namespace xpq::record
