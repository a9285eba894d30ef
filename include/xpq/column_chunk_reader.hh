#pragma once

#include <xpq/exception.hh>
#include <xpq/io.hh>
#include <xpq/overloaded.hh>
#include <xpq/parquet_types.h>

#include <arrow/util/rle_encoding.h>
#include <arrow/util/bit_stream_utils.h>

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include <array>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace xpq {

using RleDecoder = arrow::util::RleDecoder;
using BitReader = arrow::bit_util::BitReader;

struct page {
    const format::PageHeader* header;
    bytes_view contents;
};

class peekable_stream;

class page_reader {
    std::unique_ptr<peekable_stream> _source;
    std::unique_ptr<format::PageHeader> _latest_header;
public:
    explicit page_reader(seastar::input_stream<char>&& source);
    page_reader(page_reader&&) noexcept;
    page_reader& operator=(page_reader&&) noexcept;
    ~page_reader();
    // The contents of the returned page are invalidated by the next call.
    seastar::future<std::optional<page>> next_page();
    seastar::future<> close();
};

class decompressor {
    seastar::temporary_buffer<uint8_t> _buffer;
    const format::CompressionCodec::type _codec;
public:
    explicit decompressor(format::CompressionCodec::type codec)
        : _codec(codec) {}
    // The result is invalidated by the next call.
    bytes_view operator()(bytes_view input, size_t decompressed_len);
    format::CompressionCodec::type codec() const { return _codec; }
};

// The deprecated BIT_PACKED level encoding. Unlike the hybrid encoding, values are packed
// starting from the most significant bit of each byte.
class bit_packed_decoder {
    bytes_view _data;
    uint32_t _bit_width;
    uint64_t _bit_offset = 0;
public:
    bit_packed_decoder(bytes_view data, uint32_t bit_width)
        : _data(data), _bit_width(bit_width) {}

    template <typename T>
    size_t read_batch(size_t n, T out[]) {
        for (size_t i = 0; i < n; ++i) {
            if (_bit_offset + _bit_width > _data.size() * 8) {
                return i;
            }
            uint32_t v = 0;
            for (uint32_t b = 0; b < _bit_width; ++b, ++_bit_offset) {
                v = (v << 1) | ((_data[_bit_offset / 8] >> (7 - _bit_offset % 8)) & 1);
            }
            out[i] = static_cast<T>(v);
        }
        return n;
    }
};

class level_decoder {
    std::variant<RleDecoder, bit_packed_decoder> _decoder;
    uint32_t _bit_width;
    uint32_t _num_values;
    uint32_t _values_read;
    static uint32_t bit_width(uint32_t max_n) {
        return (max_n == 0) ? 0 : seastar::log2floor(max_n) + 1;
    }
public:
    explicit level_decoder(uint32_t max_level) : _bit_width(bit_width(max_level)) {}

    // Set a new source of levels. V1 and V2 are for data pages version 1 and 2 respectively.
    // reset_v1 returns the number of bytes the levels take up in the page.
    size_t reset_v1(bytes_view buffer, format::Encoding::type encoding, uint32_t num_values);
    void reset_v2(bytes_view encoded_levels, uint32_t num_values);

    // Read a batch of n levels (the last batch may be smaller than n).
    template <typename T>
    size_t read_batch(size_t n, T out[]) {
        n = std::min(n, static_cast<size_t>(_num_values - _values_read));
        if (_bit_width == 0) {
            std::fill(out, out + n, 0);
            _values_read += n;
            return n;
        }
        size_t n_read = std::visit(overloaded {
            [n, out] (RleDecoder& d) -> size_t { return d.GetBatch(out, static_cast<int>(n)); },
            [n, out] (bit_packed_decoder& d) -> size_t { return d.read_batch(n, out); },
        }, _decoder);
        if (n_read != n) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "end of page while reading levels (expected {} more, got {})", n, n_read));
        }
        _values_read += n;
        return n;
    }
};

template <typename T>
class plain_decoder_trivial {
    bytes_view _buffer;
public:
    void reset(bytes_view data);
    size_t read_batch(size_t n, T out[]);
};

class plain_decoder_boolean {
    BitReader _decoder;
public:
    void reset(bytes_view data);
    size_t read_batch(size_t n, uint8_t out[]);
};

class plain_decoder_byte_array {
    seastar::temporary_buffer<uint8_t> _buffer;
public:
    void reset(bytes_view data);
    size_t read_batch(size_t n, seastar::temporary_buffer<uint8_t> out[]);
};

class plain_decoder_fixed_len_byte_array {
    size_t _fixed_len;
    seastar::temporary_buffer<uint8_t> _buffer;
public:
    explicit plain_decoder_fixed_len_byte_array(size_t fixed_len = 0)
        : _fixed_len(fixed_len) {}
    void reset(bytes_view data);
    size_t read_batch(size_t n, seastar::temporary_buffer<uint8_t> out[]);
};

template <typename T>
class dict_decoder {
    T* _dict;
    size_t _dict_size;
    RleDecoder _rle_decoder;
public:
    explicit dict_decoder(T dict[], size_t dict_size)
        : _dict(dict)
        , _dict_size(dict_size) {};
    void reset(bytes_view data);
    size_t read_batch(size_t n, T out[]);
};

class rle_decoder_boolean {
    RleDecoder _rle_decoder;
public:
    void reset(bytes_view data);
    size_t read_batch(size_t n, uint8_t out[]);
};

template<format::Type::type T>
struct value_decoder_traits;

template<> struct value_decoder_traits<format::Type::INT32> {
    using output_type = int32_t;
    using decoder_type = std::variant<
            plain_decoder_trivial<output_type>,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::INT64> {
    using output_type = int64_t;
    using decoder_type = std::variant<
            plain_decoder_trivial<output_type>,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::INT96> {
    using output_type = std::array<int32_t, 3>;
    static_assert(sizeof(output_type) == 12);
    using decoder_type = std::variant<
            plain_decoder_trivial<output_type>,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::FLOAT> {
    using output_type = float;
    using decoder_type = std::variant<
            plain_decoder_trivial<output_type>,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::DOUBLE> {
    using output_type = double;
    using decoder_type = std::variant<
            plain_decoder_trivial<output_type>,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::BOOLEAN> {
    using output_type = uint8_t;
    using decoder_type = std::variant<
            plain_decoder_boolean,
            rle_decoder_boolean,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::BYTE_ARRAY> {
    using output_type = seastar::temporary_buffer<uint8_t>;
    using decoder_type = std::variant<
            plain_decoder_byte_array,
            dict_decoder<output_type>>;
};

template<> struct value_decoder_traits<format::Type::FIXED_LEN_BYTE_ARRAY> {
    using output_type = seastar::temporary_buffer<uint8_t>;
    using decoder_type = std::variant<
            plain_decoder_fixed_len_byte_array,
            dict_decoder<output_type>>;
};

template<format::Type::type T>
class value_decoder {
public:
    using output_type = typename value_decoder_traits<T>::output_type;
private:
    typename value_decoder_traits<T>::decoder_type _decoder;
    std::optional<uint32_t> _type_length;
    bool _dict_set = false;
    output_type* _dict = nullptr;
    size_t _dict_size = 0;
public:
    explicit value_decoder(std::optional<uint32_t> type_length)
        : _type_length(type_length) {
        if constexpr (T == format::Type::FIXED_LEN_BYTE_ARRAY) {
            if (!_type_length) {
                throw metadata_error("type_length not set for FIXED_LEN_BYTE_ARRAY");
            }
        }
    }
    // Set a new dictionary (to be used for decoding RLE_DICTIONARY) for this reader.
    void reset_dict(output_type* dictionary, size_t dictionary_size);
    // Set a new source of encoded data.
    void reset(bytes_view buf, format::Encoding::type encoding);
    // Read a batch of n values (the last batch may be smaller than n).
    size_t read_batch(size_t n, output_type out[]);
};

// Reads the levels and values of one column chunk, page by page.
// Values are returned densely: only slots whose definition level equals the maximum carry one.
template<format::Type::type T>
class column_chunk_reader {
public:
    using output_type = typename value_decoder<T>::output_type;
private:
    page_reader _source;
    decompressor _decompressor;
    uint32_t _def_level;
    std::optional<uint32_t> _type_length;
    level_decoder _rep_decoder;
    level_decoder _def_decoder;
    value_decoder<T> _val_decoder;
    std::optional<std::vector<output_type>> _dict;
    bool _initialized = false;
    bool _eof = false;
    int64_t _page_ordinal = -1;
private:
    void load_data_page(page p);
    void load_data_page_v2(page p);
    void load_dictionary_page(page p);
    seastar::future<> load_next_page();
public:
    column_chunk_reader(
            page_reader&& source,
            format::CompressionCodec::type codec,
            uint32_t def_level,
            uint32_t rep_level,
            std::optional<uint32_t> type_length)
        : _source(std::move(source))
        , _decompressor(codec)
        , _def_level{def_level}
        , _type_length{type_length}
        , _rep_decoder{rep_level}
        , _def_decoder{def_level}
        , _val_decoder{type_length}
        {}

    // Read up to n (definition level, repetition level) pairs and the values that go with them.
    // Resolves to the number of level pairs read, 0 at the end of the chunk.
    template <typename LevelT>
    seastar::future<size_t> read_batch(size_t n, LevelT def[], LevelT rep[], output_type val[]);

    uint32_t def_level() const { return _def_level; }
    seastar::future<> close() { return _source.close(); }
};

template<format::Type::type T>
template<typename LevelT>
seastar::future<size_t> column_chunk_reader<T>::read_batch(size_t n, LevelT def[], LevelT rep[], output_type val[]) {
    if (_eof) {
        return seastar::make_ready_future<size_t>(0);
    }
    if (!_initialized) {
        return load_next_page().then([this, n, def, rep, val] {
            return read_batch(n, def, rep, val);
        });
    }
    return seastar::futurize_apply([this, n, def, rep, val] {
        size_t def_levels_read = _def_decoder.read_batch(n, def);
        size_t rep_levels_read = _rep_decoder.read_batch(n, rep);
        if (def_levels_read != rep_levels_read) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "number of definition levels {} does not equal the number of repetition levels {} in page {}",
                    def_levels_read, rep_levels_read, _page_ordinal));
        }
        if (def_levels_read == 0) {
            _initialized = false;
            return read_batch(n, def, rep, val);
        }
        size_t values_to_read = 0;
        for (size_t i = 0; i < def_levels_read; ++i) {
            if (def[i] == static_cast<LevelT>(_def_level)) {
                ++values_to_read;
            }
        }
        size_t values_read = _val_decoder.read_batch(values_to_read, val);
        if (values_read != values_to_read) {
            throw xpq_exception::corrupted_file(seastar::format(
                    "unexpected end of values in page {} (expected {}, got {})",
                    _page_ordinal, values_to_read, values_read));
        }
        return seastar::make_ready_future<size_t>(def_levels_read);
    });
}

extern template class column_chunk_reader<format::Type::INT32>;
extern template class column_chunk_reader<format::Type::INT64>;
extern template class column_chunk_reader<format::Type::INT96>;
extern template class column_chunk_reader<format::Type::FLOAT>;
extern template class column_chunk_reader<format::Type::DOUBLE>;
extern template class column_chunk_reader<format::Type::BOOLEAN>;
extern template class column_chunk_reader<format::Type::BYTE_ARRAY>;
extern template class column_chunk_reader<format::Type::FIXED_LEN_BYTE_ARRAY>;

} // namespace xpq
