#pragma once

#include <xpq/file_reader.hh>
#include <xpq/record_reader.hh>

#include <optional>
#include <string>
#include <vector>

namespace xpq {

// Every *.parquet file under path (recursively, sorted), or path itself if it is a file.
// Throws invalid_argument if path does not exist and metadata_error if a directory holds no parquet file.
std::vector<std::string> discover_files(const std::string& path);

// Indices of the top-level fields whose names match one of names, ignoring case.
// Unknown names are skipped. An empty list selects every field.
std::vector<size_t> select_fields(const schema::schema& schema, const std::vector<std::string>& names);

// The files of a dataset. The schema is the schema of the first file.
// All member functions must be called from a seastar thread.
class dataset {
    std::vector<std::string> _paths;
    std::optional<file_reader> _first;
public:
    explicit dataset(std::vector<std::string> paths);
    static dataset open(const std::string& path) { return dataset{discover_files(path)}; }

    const std::vector<std::string>& paths() const { return _paths; }
    file_reader& first_file();
    const schema::schema& schema() { return first_file().schema(); }
    const schema::raw_schema& raw_schema() { return first_file().raw_schema(); }
    // Sum of the row counts declared in the footers. No column data is read.
    int64_t count_rows();
    void close();
};

// The rows of all row groups of all files of a dataset, in file order.
// Only the selected top-level fields are assembled.
class row_stream {
    dataset& _dataset;
    std::vector<size_t> _selected;
    std::vector<std::string> _field_names;
    size_t _file_index = 0;
    std::optional<file_reader> _file;
    int _row_group = -1;
    std::optional<record::record_reader> _records;
private:
    bool open_next_file();
    bool open_next_row_group();
    void close_file();
public:
    row_stream(dataset& ds, std::vector<size_t> selected);
    std::optional<record::row> read_one();
    void close();
};

} // namespace xpq
