#include <xpq/file_reader.hh>
#include <xpq/exception.hh>
#include <xpq/io.hh>
#include "file_column_source.hh"
#include "peekable_stream.hh"

#include <seastar/core/file.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/log.hh>

#include <cstring>
#include <filesystem>
#include <optional>

namespace xpq {

static seastar::logger fr_logger("xpq_file_reader");

namespace {

seastar::future<std::unique_ptr<format::FileMetaData>> read_file_metadata(seastar::file file) {
    return file.size().then([file] (uint64_t size) mutable {
        if (size < 8) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "File too small ({}B) to be a parquet file", size));
        }

        // Parquet file structure:
        // ...
        // File Metadata (serialized with thrift compact protocol)
        // 4-byte length in bytes of file metadata (little endian)
        // 4-byte magic number "PAR1"
        // EOF
        return file.dma_read_exactly<uint8_t>(size - 8, 8).then(
        [file, size] (seastar::temporary_buffer<uint8_t> footer) mutable {
            if (std::memcmp(footer.get() + 4, "PARE", 4) == 0) {
                throw xpq_exception::not_implemented("Parquet encryption is currently unsupported");
            } else if (std::memcmp(footer.get() + 4, "PAR1", 4) != 0) {
                throw xpq_exception::corrupted_file("Magic bytes not found in footer");
            }

            uint32_t metadata_len;
            std::memcpy(&metadata_len, footer.get(), 4);
            if (uint64_t(metadata_len) + 8 > size) {
                throw xpq_exception::corrupted_file(seastar::format(
                        "Metadata size reported by footer ({}B) greater than file size ({}B)",
                        uint64_t(metadata_len) + 8, size));
            }

            return file.dma_read_exactly<uint8_t>(size - 8 - metadata_len, metadata_len);
        }).then([] (seastar::temporary_buffer<uint8_t> serialized_metadata) {
            auto deserialized_metadata = std::make_unique<format::FileMetaData>();
            try {
                decode_thrift(bytes_view{serialized_metadata.get(), serialized_metadata.size()}, *deserialized_metadata);
            } catch (const apache::thrift::TException& e) {
                throw xpq_exception::corrupted_file(seastar::format("could not deserialize FileMetaData: {}", e.what()));
            }
            return deserialized_metadata;
        });
    });
}

} // namespace

file_reader::file_reader(std::string path, seastar::file file, std::unique_ptr<format::FileMetaData> metadata)
    : _path{std::move(path)}
    , _file{std::move(file)}
    , _metadata{std::move(metadata)} {}

seastar::future<file_reader> file_reader::open(std::string path) {
    fr_logger.debug("opening {}", path);
    return seastar::open_file_dma(path, seastar::open_flags::ro).then(
    [path] (seastar::file file) {
        return read_file_metadata(file).then(
        [path, file] (std::unique_ptr<format::FileMetaData> metadata) {
            fr_logger.debug("{}: {} rows in {} row groups", path, metadata->num_rows, metadata->row_groups.size());
            return file_reader{path, file, std::move(metadata)};
        }).handle_exception([file] (std::exception_ptr eptr) mutable {
            return file.close().then_wrapped([eptr] (seastar::future<> f) {
                f.ignore_ready_future();
                return seastar::make_exception_future<file_reader>(eptr);
            });
        });
    }).handle_exception([path] (std::exception_ptr eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            return seastar::make_exception_future<file_reader>(metadata_error(seastar::format(
                    "Could not open parquet file {} for reading: {}", path, e.what())));
        }
    });
}


const schema::raw_schema& file_reader::raw_schema() {
    if (!_raw_schema) {
        _raw_schema = std::make_unique<schema::raw_schema>(schema::flat_schema_to_raw_schema(metadata().schema));
    }
    return *_raw_schema;
}

const schema::schema& file_reader::schema() {
    if (!_schema) {
        _schema = std::make_unique<schema::schema>(schema::raw_schema_to_schema(raw_schema()));
    }
    return *_schema;
}

namespace {

const format::ColumnChunk& find_column_chunk(const format::FileMetaData& metadata, int row_group,
        const schema::primitive_node& leaf) {
    if (row_group < 0 || static_cast<size_t>(row_group) >= metadata.row_groups.size()) {
        throw metadata_error(seastar::format("row group {} does not exist", row_group));
    }
    const format::RowGroup& rg = metadata.row_groups[row_group];
    if (leaf.column_index < 0 || static_cast<size_t>(leaf.column_index) >= rg.columns.size()) {
        throw metadata_error(seastar::format("row group has no chunk for column {} ({} chunks)",
                leaf.column_index, rg.columns.size()));
    }
    return rg.columns[leaf.column_index];
}

std::optional<uint32_t> type_length_of(const schema::primitive_node& leaf) {
    if (leaf.info.__isset.type_length) {
        if (leaf.info.type_length < 0) {
            throw metadata_error(seastar::format("negative type_length {}", leaf.info.type_length));
        }
        return static_cast<uint32_t>(leaf.info.type_length);
    }
    if (leaf.info.type == format::Type::FIXED_LEN_BYTE_ARRAY) {
        throw metadata_error("type_length of FIXED_LEN_BYTE_ARRAY is not set");
    }
    return std::nullopt;
}

// For chunks whose metadata was left out of the footer.
seastar::future<format::ColumnMetaData> read_chunk_metadata(seastar::file file, int64_t offset) {
    if (offset < 0) {
        throw xpq_exception::corrupted_file(seastar::format("negative file_offset {} of column chunk", offset));
    }
    auto stream = std::make_unique<peekable_stream>(
            seastar::make_file_input_stream(file, static_cast<uint64_t>(offset)));
    auto metadata = std::make_unique<format::ColumnMetaData>();
    auto read = read_thrift_message(*stream, *metadata);
    return read.then([metadata = std::move(metadata)] (bool found) {
        if (!found) {
            throw xpq_exception::corrupted_file("column metadata expected at file_offset, found end of file");
        }
        return std::move(*metadata);
    }).finally([stream = std::move(stream)] {
        return stream->close();
    });
}

struct chunk_pages {
    page_reader pages;
    format::CompressionCodec::type codec;
};

// A chunk may live in another file, named relative to this one.
seastar::future<chunk_pages> open_chunk_pages(const std::string& path, seastar::file file,
        const format::ColumnChunk& chunk, format::Type::type type) {
    auto chunk_file = chunk.__isset.file_path
            ? seastar::open_file_dma((std::filesystem::path(path).parent_path() / chunk.file_path).string(),
                    seastar::open_flags::ro)
            : seastar::make_ready_future<seastar::file>(file);
    return chunk_file.then([&chunk, type] (seastar::file f) {
        auto metadata = chunk.__isset.meta_data
                ? seastar::make_ready_future<format::ColumnMetaData>(chunk.meta_data)
                : read_chunk_metadata(f, chunk.file_offset);
        return metadata.then([f, type] (format::ColumnMetaData meta) {
            if (meta.type != type) {
                throw metadata_error(seastar::format("chunk holds physical type {}, schema declares {}",
                        static_cast<int>(meta.type), static_cast<int>(type)));
            }
            int64_t offset = meta.__isset.dictionary_page_offset
                    ? meta.dictionary_page_offset
                    : meta.data_page_offset;
            if (offset < 0 || meta.total_compressed_size < 0) {
                throw xpq_exception::corrupted_file(seastar::format(
                        "negative offset ({}) or size ({}) of column chunk", offset, meta.total_compressed_size));
            }
            page_reader pages{seastar::make_file_input_stream(
                    f, static_cast<uint64_t>(offset), static_cast<uint64_t>(meta.total_compressed_size))};
            return chunk_pages{std::move(pages), meta.codec};
        });
    });
}

} // namespace

template <format::Type::type T>
seastar::future<std::unique_ptr<record::column_source>>
file_reader::open_typed_column(int row_group, const schema::primitive_node& leaf) {
    const format::ColumnChunk& chunk = find_column_chunk(metadata(), row_group, leaf);
    std::optional<uint32_t> type_length = type_length_of(leaf);
    uint32_t def_level = leaf.def_level;
    uint32_t rep_level = leaf.rep_level;
    return open_chunk_pages(_path, _file, chunk, T).then([def_level, rep_level, type_length] (chunk_pages c) {
        column_chunk_reader<T> reader{std::move(c.pages), c.codec, def_level, rep_level, type_length};
        return std::unique_ptr<record::column_source>(std::make_unique<file_column_source<T>>(std::move(reader)));
    });
}

seastar::future<std::unique_ptr<record::column_source>>
file_reader::open_column(int row_group, const schema::primitive_node& leaf) {
    using result = std::unique_ptr<record::column_source>;
    fr_logger.debug("{}: opening column {} of row group {}", _path, schema::path_to_string(leaf.path), row_group);
    return seastar::futurize_apply([this, row_group, &leaf] {
        switch (leaf.info.type) {
        case format::Type::BOOLEAN: return open_typed_column<format::Type::BOOLEAN>(row_group, leaf);
        case format::Type::INT32: return open_typed_column<format::Type::INT32>(row_group, leaf);
        case format::Type::INT64: return open_typed_column<format::Type::INT64>(row_group, leaf);
        case format::Type::INT96: return open_typed_column<format::Type::INT96>(row_group, leaf);
        case format::Type::FLOAT: return open_typed_column<format::Type::FLOAT>(row_group, leaf);
        case format::Type::DOUBLE: return open_typed_column<format::Type::DOUBLE>(row_group, leaf);
        case format::Type::BYTE_ARRAY: return open_typed_column<format::Type::BYTE_ARRAY>(row_group, leaf);
        case format::Type::FIXED_LEN_BYTE_ARRAY:
            return open_typed_column<format::Type::FIXED_LEN_BYTE_ARRAY>(row_group, leaf);
        }
        throw metadata_error(seastar::format("unknown physical type {}", static_cast<int>(leaf.info.type)));
    }).handle_exception([row_group, column = schema::path_to_string(leaf.path)] (std::exception_ptr eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const metadata_error& e) {
            return seastar::make_exception_future<result>(metadata_error(seastar::format(
                    "Could not open column {} in row group {}: {}", column, row_group, e.what())));
        } catch (const std::exception& e) {
            return seastar::make_exception_future<result>(xpq_exception(seastar::format(
                    "Could not open column {} in row group {}: {}", column, row_group, e.what())));
        }
    });
}

int64_t count_rows(const format::FileMetaData& metadata) {
    int64_t rows = 0;
    for (const format::RowGroup& rg : metadata.row_groups) {
        rows += rg.num_rows;
    }
    return rows;
}

} // namespace xpq
