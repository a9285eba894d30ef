#define BOOST_TEST_MODULE xpq

#include <xpq/column_chunk_reader.hh>
#include <xpq/exception.hh>

#include <boost/test/included/unit_test.hpp>

#include <snappy.h>
#include <zlib.h>

#include <memory>
#include <string>
#include <vector>

using namespace xpq;

namespace {

using bytes = std::basic_string<uint8_t>;

bytes make_bytes(std::initializer_list<int> values) {
    bytes b;
    for (int v : values) {
        b.push_back(static_cast<uint8_t>(v));
    }
    return b;
}

bytes_view view(const bytes& b) {
    return {b.data(), b.size()};
}

template <typename T>
std::vector<T> read_levels(level_decoder& decoder, size_t n) {
    std::vector<T> out(n);
    out.resize(decoder.read_batch(n, out.data()));
    return out;
}

} // namespace

BOOST_AUTO_TEST_CASE(rle_levels) {
    // Length 4, then runs: 3 x 1, 2 x 0. Trailing bytes belong to the next section of the page.
    bytes page = make_bytes({4, 0, 0, 0, 0x06, 0x01, 0x04, 0x00, 0xAA, 0xBB});
    level_decoder decoder{1};
    BOOST_CHECK_EQUAL(decoder.reset_v1(view(page), format::Encoding::RLE, 5), 8);
    auto levels = read_levels<int16_t>(decoder, 10);
    std::vector<int16_t> expected = {1, 1, 1, 0, 0};
    BOOST_CHECK_EQUAL_COLLECTIONS(levels.begin(), levels.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(bit_packed_run_of_hybrid_levels) {
    // One group of eight 1-bit values, least significant bit first.
    bytes page = make_bytes({2, 0, 0, 0, 0x03, 0x8D});
    level_decoder decoder{1};
    decoder.reset_v1(view(page), format::Encoding::RLE, 8);
    auto levels = read_levels<int16_t>(decoder, 8);
    std::vector<int16_t> expected = {1, 0, 1, 1, 0, 0, 0, 1};
    BOOST_CHECK_EQUAL_COLLECTIONS(levels.begin(), levels.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(deprecated_bit_packed_levels) {
    // Two bits per level, most significant bit first: 11 00 10 01.
    bytes page = make_bytes({0xC9, 0xFF});
    level_decoder decoder{3};
    BOOST_CHECK_EQUAL(decoder.reset_v1(view(page), format::Encoding::BIT_PACKED, 4), 1);
    auto levels = read_levels<int16_t>(decoder, 4);
    std::vector<int16_t> expected = {3, 0, 2, 1};
    BOOST_CHECK_EQUAL_COLLECTIONS(levels.begin(), levels.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(levels_of_required_columns_are_zero) {
    bytes page = make_bytes({0x01, 0x02});
    level_decoder decoder{0};
    BOOST_CHECK_EQUAL(decoder.reset_v1(view(page), format::Encoding::RLE, 3), 0);
    auto levels = read_levels<int16_t>(decoder, 5);
    std::vector<int16_t> expected = {0, 0, 0};
    BOOST_CHECK_EQUAL_COLLECTIONS(levels.begin(), levels.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(truncated_levels) {
    level_decoder decoder{1};
    bytes short_length = make_bytes({4, 0});
    BOOST_CHECK_THROW(decoder.reset_v1(view(short_length), format::Encoding::RLE, 1), xpq_exception);
    bytes long_length = make_bytes({9, 0, 0, 0, 0x02, 0x01});
    BOOST_CHECK_THROW(decoder.reset_v1(view(long_length), format::Encoding::RLE, 1), xpq_exception);
    // The run holds one level, the page claims two.
    bytes short_run = make_bytes({2, 0, 0, 0, 0x02, 0x01});
    decoder.reset_v1(view(short_run), format::Encoding::RLE, 2);
    BOOST_CHECK_THROW(read_levels<int16_t>(decoder, 2), xpq_exception);
}

BOOST_AUTO_TEST_CASE(plain_values) {
    value_decoder<format::Type::INT32> decoder{std::nullopt};
    bytes page = make_bytes({1, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF, 7, 0, 0, 0});
    decoder.reset(view(page), format::Encoding::PLAIN);
    std::vector<int32_t> out(5);
    BOOST_REQUIRE_EQUAL(decoder.read_batch(5, out.data()), 3);
    BOOST_CHECK_EQUAL(out[0], 1);
    BOOST_CHECK_EQUAL(out[1], -1);
    BOOST_CHECK_EQUAL(out[2], 7);
}

BOOST_AUTO_TEST_CASE(plain_booleans) {
    value_decoder<format::Type::BOOLEAN> decoder{std::nullopt};
    bytes page = make_bytes({0x05});
    decoder.reset(view(page), format::Encoding::PLAIN);
    uint8_t out[3];
    BOOST_REQUIRE_EQUAL(decoder.read_batch(3, out), 3);
    BOOST_CHECK_EQUAL(out[0], 1);
    BOOST_CHECK_EQUAL(out[1], 0);
    BOOST_CHECK_EQUAL(out[2], 1);
}

BOOST_AUTO_TEST_CASE(rle_booleans) {
    value_decoder<format::Type::BOOLEAN> decoder{std::nullopt};
    bytes page = make_bytes({2, 0, 0, 0, 0x06, 0x01});
    decoder.reset(view(page), format::Encoding::RLE);
    uint8_t out[3];
    BOOST_REQUIRE_EQUAL(decoder.read_batch(3, out), 3);
    BOOST_CHECK(out[0] == 1 && out[1] == 1 && out[2] == 1);
}

BOOST_AUTO_TEST_CASE(plain_byte_arrays) {
    value_decoder<format::Type::BYTE_ARRAY> decoder{std::nullopt};
    bytes page = make_bytes({3, 0, 0, 0, 'r', 'e', 'd', 0, 0, 0, 0, 4, 0, 0, 0, 'b', 'l'});
    decoder.reset(view(page), format::Encoding::PLAIN);
    seastar::temporary_buffer<uint8_t> out[2];
    BOOST_REQUIRE_EQUAL(decoder.read_batch(2, out), 2);
    BOOST_CHECK_EQUAL(std::string(reinterpret_cast<const char*>(out[0].get()), out[0].size()), "red");
    BOOST_CHECK_EQUAL(out[1].size(), 0);
    // The third value claims four bytes but only two are left.
    BOOST_CHECK_THROW(decoder.read_batch(1, out), xpq_exception);
}

BOOST_AUTO_TEST_CASE(plain_fixed_len_byte_arrays) {
    BOOST_CHECK_THROW(value_decoder<format::Type::FIXED_LEN_BYTE_ARRAY>{std::nullopt}, metadata_error);
    value_decoder<format::Type::FIXED_LEN_BYTE_ARRAY> decoder{2};
    bytes page = make_bytes({'a', 'b', 'c', 'd'});
    decoder.reset(view(page), format::Encoding::PLAIN);
    seastar::temporary_buffer<uint8_t> out[3];
    BOOST_REQUIRE_EQUAL(decoder.read_batch(3, out), 2);
    BOOST_CHECK_EQUAL(std::string(reinterpret_cast<const char*>(out[1].get()), out[1].size()), "cd");
}

BOOST_AUTO_TEST_CASE(dictionary_values) {
    std::vector<int32_t> dict = {10, 20, 30};
    value_decoder<format::Type::INT32> decoder{std::nullopt};
    bytes page = make_bytes({2, 0x04, 0x02, 0x02, 0x00});
    BOOST_CHECK_THROW(decoder.reset(view(page), format::Encoding::RLE_DICTIONARY), xpq_exception);

    decoder.reset_dict(dict.data(), dict.size());
    decoder.reset(view(page), format::Encoding::RLE_DICTIONARY);
    std::vector<int32_t> out(4);
    BOOST_REQUIRE_EQUAL(decoder.read_batch(4, out.data()), 3);
    std::vector<int32_t> expected = {30, 30, 10};
    out.resize(3);
    BOOST_CHECK_EQUAL_COLLECTIONS(out.begin(), out.end(), expected.begin(), expected.end());

    bytes out_of_range = make_bytes({2, 0x02, 0x03});
    decoder.reset(view(out_of_range), format::Encoding::RLE_DICTIONARY);
    BOOST_CHECK_THROW(decoder.read_batch(1, out.data()), xpq_exception);
}

BOOST_AUTO_TEST_CASE(unsupported_value_encodings) {
    value_decoder<format::Type::INT64> decoder{std::nullopt};
    bytes page = make_bytes({0, 0, 0, 0});
    BOOST_CHECK_THROW(decoder.reset(view(page), format::Encoding::RLE), xpq_exception);
    BOOST_CHECK_THROW(decoder.reset(view(page), format::Encoding::DELTA_BINARY_PACKED), xpq_exception);
}

BOOST_AUTO_TEST_CASE(decompression) {
    std::string text = "favorite_color favorite_color favorite_color";

    std::string snappy_compressed;
    snappy::Compress(text.data(), text.size(), &snappy_compressed);
    decompressor snappy_decompressor{format::CompressionCodec::SNAPPY};
    bytes_view out = snappy_decompressor(
            bytes_view(reinterpret_cast<const uint8_t*>(snappy_compressed.data()), snappy_compressed.size()),
            text.size());
    BOOST_CHECK_EQUAL(std::string(reinterpret_cast<const char*>(out.data()), out.size()), text);

    std::vector<uint8_t> gzip_compressed(compressBound(text.size()));
    uLongf gzip_len = gzip_compressed.size();
    BOOST_REQUIRE_EQUAL(compress2(gzip_compressed.data(), &gzip_len,
            reinterpret_cast<const Bytef*>(text.data()), text.size(), Z_BEST_SPEED), Z_OK);
    decompressor gzip_decompressor{format::CompressionCodec::GZIP};
    out = gzip_decompressor(bytes_view(gzip_compressed.data(), gzip_len), text.size());
    BOOST_CHECK_EQUAL(std::string(reinterpret_cast<const char*>(out.data()), out.size()), text);
    BOOST_CHECK_THROW(gzip_decompressor(bytes_view(gzip_compressed.data(), gzip_len), text.size() + 1),
            xpq_exception);

    decompressor lzo{format::CompressionCodec::LZO};
    BOOST_CHECK_THROW(lzo(bytes_view(gzip_compressed.data(), gzip_len), text.size()), xpq_exception);
}

BOOST_AUTO_TEST_CASE(thrift_decoding_reports_consumed_bytes) {
    using memory_transport = apache::thrift::transport::TMemoryBuffer;
    format::SchemaElement se;
    se.__set_type(format::Type::DOUBLE);
    format::FileMetaData fmd;
    fmd.__set_version(1);
    fmd.__set_num_rows(0);
    fmd.__set_schema({se});
    auto transport = std::make_shared<memory_transport>();
    apache::thrift::protocol::TCompactProtocolT<memory_transport> protocol{transport};
    fmd.write(&protocol);
    uint8_t* data;
    uint32_t size;
    transport->getBuffer(&data, &size);
    bytes serialized(data, size);
    size_t encoded_size = serialized.size();
    serialized += make_bytes({0x15, 0x02});

    format::FileMetaData fmd2;
    BOOST_CHECK_EQUAL(decode_thrift(view(serialized), fmd2), encoded_size);
    BOOST_CHECK(fmd2.schema[0].type == format::Type::DOUBLE);

    format::FileMetaData truncated;
    BOOST_CHECK_THROW(decode_thrift(view(serialized).substr(0, encoded_size - 1), truncated),
            apache::thrift::transport::TTransportException);
}
