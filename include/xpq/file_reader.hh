#pragma once

#include <xpq/parquet_types.h>
#include <xpq/record_reader.hh>
#include <xpq/schema.hh>

#include <seastar/core/file.hh>
#include <seastar/core/future.hh>

#include <memory>
#include <string>

namespace xpq {

// One parquet file: its footer, its schema and the columns of its row groups.
// Columns opened from a file_reader must be closed before it is.
class file_reader {
    std::string _path;
    seastar::file _file;
    std::unique_ptr<format::FileMetaData> _metadata;
    std::unique_ptr<schema::raw_schema> _raw_schema;
    std::unique_ptr<schema::schema> _schema;
private:
    file_reader(std::string path, seastar::file file, std::unique_ptr<format::FileMetaData> metadata);
    template <format::Type::type T>
    seastar::future<std::unique_ptr<record::column_source>>
    open_typed_column(int row_group, const schema::primitive_node& leaf);
public:
    // Throws metadata_error if the file cannot be opened or its footer cannot be read.
    static seastar::future<file_reader> open(std::string path);
    seastar::future<> close() { return _file.close(); }

    const std::string& path() const { return _path; }
    const format::FileMetaData& metadata() const { return *_metadata; }
    // Built on first use, so that the row counts of a file stay readable when its schema is not.
    const schema::raw_schema& raw_schema();
    const schema::schema& schema();

    // The triplets of leaf in row_group. leaf.column_index selects the column chunk.
    // The returned source reads pages on demand and must be used from a seastar thread.
    seastar::future<std::unique_ptr<record::column_source>>
    open_column(int row_group, const schema::primitive_node& leaf);
};

// Total number of rows declared by the row groups of a file.
int64_t count_rows(const format::FileMetaData& metadata);

} // namespace xpq
