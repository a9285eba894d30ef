#include <xpq/column_chunk_reader.hh>
#include "compression.hh"
#include "peekable_stream.hh"

#include <seastar/util/log.hh>

#include <algorithm>
#include <cstring>
#include <limits>

namespace xpq {

static seastar::logger ccr_logger("xpq_column_chunk_reader");

page_reader::page_reader(seastar::input_stream<char>&& source)
    : _source{std::make_unique<peekable_stream>(std::move(source))}
    , _latest_header{std::make_unique<format::PageHeader>()} {}

page_reader::page_reader(page_reader&&) noexcept = default;
page_reader& page_reader::operator=(page_reader&&) noexcept = default;
page_reader::~page_reader() = default;

seastar::future<> page_reader::close() {
    return _source->close();
}

seastar::future<std::optional<page>> page_reader::next_page() {
    return read_thrift_message(*_source, *_latest_header).then([this] (bool read) {
        if (!read) {
            return seastar::make_ready_future<std::optional<page>>();
        }
        if (_latest_header->compressed_page_size < 0) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "negative compressed_page_size in page header: {}", _latest_header->compressed_page_size));
        }
        size_t compressed_size = static_cast<uint32_t>(_latest_header->compressed_page_size);
        return _source->peek(compressed_size).then([this, compressed_size] (bytes_view page_contents) {
            if (page_contents.size() < compressed_size) {
                throw xpq_exception::corrupted_file(seastar::format(
                        "unexpected end of column chunk while reading page contents (expected {}B, got {}B)",
                        compressed_size, page_contents.size()));
            }
            return _source->advance(compressed_size).then([this, page_contents] {
                return seastar::make_ready_future<std::optional<page>>(page{_latest_header.get(), page_contents});
            });
        });
    });
}

bytes_view decompressor::operator()(bytes_view input, size_t decompressed_len) {
    if (_codec == format::CompressionCodec::UNCOMPRESSED) {
        return input;
    }
    if (decompressed_len > _buffer.size()) {
        _buffer = seastar::temporary_buffer<uint8_t>(std::max(decompressed_len, _buffer.size() * 2));
    }
    switch (_codec) {
    case format::CompressionCodec::SNAPPY:
        compression::snappy_decompress(input.data(), input.size(), _buffer.get_write(), decompressed_len);
        break;
    case format::CompressionCodec::GZIP:
        compression::zlib_decompress(input.data(), input.size(), _buffer.get_write(), decompressed_len);
        break;
    default:
        throw xpq_exception::not_implemented(seastar::format(
                "compression codec {}", static_cast<int>(_codec)));
    }
    return {_buffer.get(), decompressed_len};
}

size_t level_decoder::reset_v1(bytes_view buffer, format::Encoding::type encoding, uint32_t num_values) {
    _num_values = num_values;
    _values_read = 0;
    if (_bit_width == 0) {
        return 0;
    }
    if (encoding == format::Encoding::RLE) {
        if (buffer.size() < 4) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading levels (needed {}B, got {}B)", 4, buffer.size()));
        }
        int32_t len;
        std::memcpy(&len, buffer.data(), 4);
        if (len < 0) {
            throw xpq_exception::corrupted_file(seastar::format("negative RLE levels length ({})", len));
        }
        if (static_cast<size_t>(len) > buffer.size() - 4) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading levels (needed {}B, got {}B)", len, buffer.size() - 4));
        }
        _decoder = RleDecoder{buffer.data() + 4, len, static_cast<int>(_bit_width)};
        return 4 + len;
    } else if (encoding == format::Encoding::BIT_PACKED) {
        uint64_t bit_len = static_cast<uint64_t>(num_values) * _bit_width;
        uint64_t byte_len = (bit_len + 7) >> 3;
        if (byte_len > buffer.size()) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading levels (needed {}B, got {}B)", byte_len, buffer.size()));
        }
        _decoder = bit_packed_decoder{buffer.substr(0, byte_len), _bit_width};
        return byte_len;
    }
    throw xpq_exception::not_implemented(seastar::format("level encoding {}", static_cast<int>(encoding)));
}

void level_decoder::reset_v2(bytes_view encoded_levels, uint32_t num_values) {
    _num_values = num_values;
    _values_read = 0;
    if (encoded_levels.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw xpq_exception::corrupted_file(seastar::format(
                "levels length exceeds int ({}B)", encoded_levels.size()));
    }
    _decoder = RleDecoder{
        encoded_levels.data(),
        static_cast<int>(encoded_levels.size()),
        static_cast<int>(_bit_width)};
}

template <typename T>
void plain_decoder_trivial<T>::reset(bytes_view data) {
    _buffer = data;
}

template <typename T>
size_t plain_decoder_trivial<T>::read_batch(size_t n, T out[]) {
    size_t n_to_read = std::min(_buffer.size() / sizeof(T), n);
    size_t bytes_to_read = sizeof(T) * n_to_read;
    if (bytes_to_read > 0) {
        std::memcpy(out, _buffer.data(), bytes_to_read);
    }
    _buffer.remove_prefix(bytes_to_read);
    return n_to_read;
}

void plain_decoder_boolean::reset(bytes_view data) {
    _decoder.Reset(data.data(), static_cast<int>(data.size()));
}

size_t plain_decoder_boolean::read_batch(size_t n, uint8_t out[]) {
    return _decoder.GetBatch(1, out, static_cast<int>(n));
}

// Page buffers are reused, so byte arrays are copied into a buffer the values can share.
void plain_decoder_byte_array::reset(bytes_view data) {
    _buffer = seastar::temporary_buffer<uint8_t>(data.size());
    std::memcpy(_buffer.get_write(), data.data(), data.size());
}

size_t plain_decoder_byte_array::read_batch(size_t n, seastar::temporary_buffer<uint8_t> out[]) {
    for (size_t i = 0; i < n; ++i) {
        if (_buffer.size() == 0) {
            return i;
        }
        if (_buffer.size() < 4) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading BYTE_ARRAY length (needed {}B, got {}B)", 4, _buffer.size()));
        }
        uint32_t len;
        std::memcpy(&len, _buffer.get(), 4);
        _buffer.trim_front(4);
        if (len > _buffer.size()) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading BYTE_ARRAY (needed {}B, got {}B)", len, _buffer.size()));
        }
        out[i] = _buffer.share(0, len);
        _buffer.trim_front(len);
    }
    return n;
}

void plain_decoder_fixed_len_byte_array::reset(bytes_view data) {
    _buffer = seastar::temporary_buffer<uint8_t>(data.size());
    std::memcpy(_buffer.get_write(), data.data(), data.size());
}

size_t plain_decoder_fixed_len_byte_array::read_batch(size_t n, seastar::temporary_buffer<uint8_t> out[]) {
    for (size_t i = 0; i < n; ++i) {
        if (_buffer.size() == 0) {
            return i;
        }
        if (_fixed_len > _buffer.size()) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading FIXED_LEN_BYTE_ARRAY (needed {}B, got {}B)",
                    _fixed_len, _buffer.size()));
        }
        out[i] = _buffer.share(0, _fixed_len);
        _buffer.trim_front(_fixed_len);
    }
    return n;
}

template <typename T>
void dict_decoder<T>::reset(bytes_view data) {
    if (data.size() == 0) {
        _rle_decoder.Reset(data.data(), 0, 0);
        return;
    }
    int bit_width = data.data()[0];
    if (bit_width > 32) {
        throw xpq_exception::corrupted_file(seastar::format(
                "illegal dictionary index bit width (should be 0 <= bit width <= 32, got {})", bit_width));
    }
    _rle_decoder.Reset(data.data() + 1, static_cast<int>(data.size() - 1), bit_width);
}

template <typename T>
size_t dict_decoder<T>::read_batch(size_t n, T out[]) {
    std::array<uint32_t, 1000> buf;
    size_t completed = 0;
    while (completed < n) {
        size_t n_to_read = std::min(n - completed, buf.size());
        size_t n_read = _rle_decoder.GetBatch(buf.data(), static_cast<int>(n_to_read));
        for (size_t i = 0; i < n_read; ++i) {
            if (buf[i] >= _dict_size) {
                throw xpq_exception::corrupted_file(seastar::format(
                        "dictionary index out of range (dictionary size = {}, index = {})", _dict_size, buf[i]));
            }
        }
        for (size_t i = 0; i < n_read; ++i) {
            if constexpr (std::is_trivially_copyable_v<T>) {
                out[completed + i] = _dict[buf[i]];
            } else {
                out[completed + i] = _dict[buf[i]].share();
            }
        }
        completed += n_read;
        if (n_read < n_to_read) {
            return completed;
        }
    }
    return n;
}

// RLE booleans are prefixed with the 4-byte length of the encoded run data.
void rle_decoder_boolean::reset(bytes_view data) {
    if (data.size() < 4) {
        throw xpq_exception::corrupted_file(seastar::format(
                "end of page while reading RLE boolean length (needed {}B, got {}B)", 4, data.size()));
    }
    int32_t len;
    std::memcpy(&len, data.data(), 4);
    if (len < 0 || static_cast<size_t>(len) > data.size() - 4) {
        throw xpq_exception::corrupted_file(seastar::format("invalid RLE boolean data length ({})", len));
    }
    _rle_decoder.Reset(data.data() + 4, len, 1);
}

size_t rle_decoder_boolean::read_batch(size_t n, uint8_t out[]) {
    return _rle_decoder.GetBatch(out, static_cast<int>(n));
}

template<format::Type::type T>
void value_decoder<T>::reset_dict(output_type* dictionary, size_t dictionary_size) {
    _dict = dictionary;
    _dict_size = dictionary_size;
    _dict_set = true;
}

template<format::Type::type T>
void value_decoder<T>::reset(bytes_view buf, format::Encoding::type encoding) {
    switch (encoding) {
    case format::Encoding::PLAIN:
        if constexpr (T == format::Type::BOOLEAN) {
            _decoder = plain_decoder_boolean{};
        } else if constexpr (T == format::Type::BYTE_ARRAY) {
            _decoder = plain_decoder_byte_array{};
        } else if constexpr (T == format::Type::FIXED_LEN_BYTE_ARRAY) {
            _decoder = plain_decoder_fixed_len_byte_array{static_cast<size_t>(*_type_length)};
        } else {
            _decoder = plain_decoder_trivial<output_type>{};
        }
        break;
    case format::Encoding::RLE_DICTIONARY:
    case format::Encoding::PLAIN_DICTIONARY:
        if (!_dict_set) {
            throw xpq_exception::corrupted_file("no dictionary page found before a dictionary-encoded page");
        }
        _decoder = dict_decoder<output_type>{_dict, _dict_size};
        break;
    case format::Encoding::RLE:
        if constexpr (T == format::Type::BOOLEAN) {
            _decoder = rle_decoder_boolean{};
        } else {
            throw xpq_exception::corrupted_file("RLE encoding is valid only for BOOLEAN values");
        }
        break;
    default:
        throw xpq_exception::not_implemented(seastar::format("value encoding {}", static_cast<int>(encoding)));
    }
    std::visit([&buf] (auto& dec) { dec.reset(buf); }, _decoder);
}

template<format::Type::type T>
size_t value_decoder<T>::read_batch(size_t n, output_type out[]) {
    return std::visit([n, out] (auto& d) { return d.read_batch(n, out); }, _decoder);
}

template<format::Type::type T>
void column_chunk_reader<T>::load_data_page(page p) {
    if (!p.header->__isset.data_page_header) {
        throw xpq_exception::corrupted_file(seastar::format(
                "DataPageHeader not set for DATA_PAGE in page {}", _page_ordinal));
    }
    const format::DataPageHeader& header = p.header->data_page_header;
    if (header.num_values < 0) {
        throw xpq_exception::corrupted_file(seastar::format(
                "negative num_values in page header: {}", header.num_values));
    }
    if (p.header->uncompressed_page_size < 0) {
        throw xpq_exception::corrupted_file(seastar::format(
                "negative uncompressed_page_size in page header: {}", p.header->uncompressed_page_size));
    }
    bytes_view contents = _decompressor(p.contents, static_cast<uint32_t>(p.header->uncompressed_page_size));
    size_t n_read = 0;
    n_read = _rep_decoder.reset_v1(contents, header.repetition_level_encoding, header.num_values);
    contents.remove_prefix(n_read);
    n_read = _def_decoder.reset_v1(contents, header.definition_level_encoding, header.num_values);
    contents.remove_prefix(n_read);
    _val_decoder.reset(contents, header.encoding);
}

template<format::Type::type T>
void column_chunk_reader<T>::load_data_page_v2(page p) {
    if (!p.header->__isset.data_page_header_v2) {
        throw xpq_exception::corrupted_file(seastar::format(
                "DataPageHeaderV2 not set for DATA_PAGE_V2 in page {}", _page_ordinal));
    }
    const format::DataPageHeaderV2& header = p.header->data_page_header_v2;
    if (header.num_values < 0) {
        throw xpq_exception::corrupted_file(seastar::format(
                "negative num_values in page header: {}", header.num_values));
    }
    if (header.repetition_levels_byte_length < 0 || header.definition_levels_byte_length < 0) {
        throw xpq_exception::corrupted_file("negative levels byte length in page header");
    }
    size_t levels_size = static_cast<size_t>(header.repetition_levels_byte_length)
            + header.definition_levels_byte_length;
    if (levels_size > p.contents.size()) {
        throw xpq_exception::corrupted_file(seastar::format(
                "levels ({}B) do not fit in page ({}B)", levels_size, p.contents.size()));
    }
    if (p.header->uncompressed_page_size < 0 || static_cast<size_t>(p.header->uncompressed_page_size) < levels_size) {
        throw xpq_exception::corrupted_file(seastar::format(
                "invalid uncompressed_page_size in page header: {}", p.header->uncompressed_page_size));
    }
    bytes_view contents = p.contents;
    _rep_decoder.reset_v2(contents.substr(0, header.repetition_levels_byte_length), header.num_values);
    contents.remove_prefix(header.repetition_levels_byte_length);
    _def_decoder.reset_v2(contents.substr(0, header.definition_levels_byte_length), header.num_values);
    contents.remove_prefix(header.definition_levels_byte_length);
    bytes_view values = contents;
    if (!header.__isset.is_compressed || header.is_compressed) {
        size_t uncompressed_values_size = static_cast<size_t>(p.header->uncompressed_page_size) - levels_size;
        values = _decompressor(contents, uncompressed_values_size);
    }
    _val_decoder.reset(values, header.encoding);
}

template<format::Type::type T>
void column_chunk_reader<T>::load_dictionary_page(page p) {
    if (!p.header->__isset.dictionary_page_header) {
        throw xpq_exception::corrupted_file(seastar::format(
                "DictionaryPageHeader not set for DICTIONARY_PAGE in page {}", _page_ordinal));
    }
    const format::DictionaryPageHeader& header = p.header->dictionary_page_header;
    if (header.num_values < 0) {
        throw xpq_exception::corrupted_file(seastar::format(
                "negative num_values in dictionary page header: {}", header.num_values));
    }
    if (p.header->uncompressed_page_size < 0) {
        throw xpq_exception::corrupted_file(seastar::format(
                "negative uncompressed_page_size in page header: {}", p.header->uncompressed_page_size));
    }
    _dict = std::vector<output_type>(header.num_values);
    bytes_view decompressed_values =
            _decompressor(p.contents, static_cast<size_t>(p.header->uncompressed_page_size));
    value_decoder<T> vd{_type_length};
    vd.reset(decompressed_values, format::Encoding::PLAIN);
    size_t n_read = vd.read_batch(_dict->size(), _dict->data());
    if (n_read < _dict->size()) {
        throw xpq_exception::corrupted_file(seastar::format(
                "unexpected end of dictionary page (expected {} values, got {})", _dict->size(), n_read));
    }
    _val_decoder.reset_dict(_dict->data(), _dict->size());
}

template<format::Type::type T>
seastar::future<> column_chunk_reader<T>::load_next_page() {
    ++_page_ordinal;
    return _source.next_page().then([this] (std::optional<page> p) {
        if (!p) {
            _eof = true;
            return;
        }
        switch (p->header->type) {
        case format::PageType::DATA_PAGE:
            load_data_page(*p);
            _initialized = true;
            return;
        case format::PageType::DATA_PAGE_V2:
            load_data_page_v2(*p);
            _initialized = true;
            return;
        case format::PageType::DICTIONARY_PAGE:
            load_dictionary_page(*p);
            return;
        default:
            ccr_logger.warn("skipping page {} of type {}", _page_ordinal, static_cast<int>(p->header->type));
        }
    });
}

template class column_chunk_reader<format::Type::INT32>;
template class column_chunk_reader<format::Type::INT64>;
template class column_chunk_reader<format::Type::INT96>;
template class column_chunk_reader<format::Type::FLOAT>;
template class column_chunk_reader<format::Type::DOUBLE>;
template class column_chunk_reader<format::Type::BOOLEAN>;
template class column_chunk_reader<format::Type::BYTE_ARRAY>;
template class column_chunk_reader<format::Type::FIXED_LEN_BYTE_ARRAY>;
// Member functions of value_decoder are not instantiated through column_chunk_reader.
template class value_decoder<format::Type::INT32>;
template class value_decoder<format::Type::INT64>;
template class value_decoder<format::Type::INT96>;
template class value_decoder<format::Type::FLOAT>;
template class value_decoder<format::Type::DOUBLE>;
template class value_decoder<format::Type::BOOLEAN>;
template class value_decoder<format::Type::BYTE_ARRAY>;
template class value_decoder<format::Type::FIXED_LEN_BYTE_ARRAY>;

} // namespace xpq
