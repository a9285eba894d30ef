#include <xpq/dataset.hh>
#include <xpq/exception.hh>

#include <seastar/util/log.hh>
#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <filesystem>

namespace xpq {

static seastar::logger ds_logger("xpq_dataset");

namespace fs = std::filesystem;

std::vector<std::string> discover_files(const std::string& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw invalid_argument(seastar::format("{}: no such file or directory", path));
    }
    if (!fs::is_directory(status)) {
        return {path};
    }
    std::vector<std::string> files;
    for (const fs::directory_entry& entry : fs::recursive_directory_iterator(path)) {
        if (entry.is_regular_file() && entry.path().extension() == ".parquet") {
            files.push_back(entry.path().string());
        }
    }
    if (files.empty()) {
        throw metadata_error(seastar::format("{}: directory contains no parquet files", path));
    }
    std::sort(files.begin(), files.end());
    ds_logger.debug("{}: found {} parquet files", path, files.size());
    return files;
}

std::vector<size_t> select_fields(const schema::schema& schema, const std::vector<std::string>& names) {
    std::vector<size_t> selected;
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        const std::string& field_name = schema::name(schema.fields[i]);
        bool wanted = names.empty() || std::any_of(names.begin(), names.end(), [&] (const std::string& name) {
            return boost::iequals(name, field_name);
        });
        if (wanted) {
            selected.push_back(i);
        }
    }
    return selected;
}

namespace {

std::vector<std::string> top_level_names(const schema::schema& schema) {
    std::vector<std::string> names;
    for (const schema::node& field : schema.fields) {
        names.push_back(schema::name(field));
    }
    return names;
}

} // namespace

dataset::dataset(std::vector<std::string> paths)
    : _paths{std::move(paths)} {
    if (_paths.empty()) {
        throw invalid_argument("a dataset needs at least one file");
    }
}

file_reader& dataset::first_file() {
    if (!_first) {
        _first.emplace(file_reader::open(_paths[0]).get0());
    }
    return *_first;
}

int64_t dataset::count_rows() {
    int64_t rows = xpq::count_rows(first_file().metadata());
    for (size_t i = 1; i < _paths.size(); ++i) {
        file_reader fr = file_reader::open(_paths[i]).get0();
        rows += xpq::count_rows(fr.metadata());
        fr.close().get();
    }
    return rows;
}

void dataset::close() {
    if (_first) {
        _first->close().get();
        _first.reset();
    }
}

row_stream::row_stream(dataset& ds, std::vector<size_t> selected)
    : _dataset{ds}
    , _selected{std::move(selected)}
    , _field_names{top_level_names(ds.schema())} {}

bool row_stream::open_next_file() {
    close_file();
    if (_file_index == _dataset.paths().size()) {
        return false;
    }
    const std::string& path = _dataset.paths()[_file_index++];
    _file.emplace(file_reader::open(path).get0());
    if (top_level_names(_file->schema()) != _field_names) {
        throw metadata_error(seastar::format(
                "{}: top-level fields differ from those of {}", path, _dataset.paths()[0]));
    }
    _row_group = -1;
    return true;
}

bool row_stream::open_next_row_group() {
    if (_records) {
        _records->close();
        _records.reset();
    }
    while (!_file || _row_group + 1 >= static_cast<int>(_file->metadata().row_groups.size())) {
        if (!open_next_file()) {
            return false;
        }
    }
    ++_row_group;
    const format::RowGroup& rg = _file->metadata().row_groups[_row_group];
    ds_logger.debug("{}: reading row group {} ({} rows)", _file->path(), _row_group, rg.num_rows);
    file_reader& fr = *_file;
    int row_group = _row_group;
    _records.emplace(record::record_reader::make(
            fr.schema(), row_group, rg.num_rows,
            [&fr, row_group] (const schema::primitive_node& leaf) {
                return fr.open_column(row_group, leaf).get0();
            },
            _selected));
    return true;
}

void row_stream::close_file() {
    if (_records) {
        _records->close();
        _records.reset();
    }
    if (_file) {
        _file->close().get();
        _file.reset();
    }
}

std::optional<record::row> row_stream::read_one() {
    while (true) {
        if (_records) {
            if (auto row = _records->read_one()) {
                return row;
            }
        }
        if (!open_next_row_group()) {
            return std::nullopt;
        }
    }
}

void row_stream::close() {
    close_file();
    _file_index = _dataset.paths().size();
}

} // namespace xpq
