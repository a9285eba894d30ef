#include <xpq/exception.hh>
#include <snappy.h>
#include <zlib.h>
#include "compression.hh"

namespace xpq::compression {

void snappy_decompress(const uint8_t* input, size_t input_len, uint8_t* output, size_t output_len) {
    size_t decompressed_size;
    if (!snappy::GetUncompressedLength(
            reinterpret_cast<const char*>(input),
            input_len,
            &decompressed_size)) {
        throw xpq_exception::corrupted_file("corrupt snappy-compressed data");
    }
    if (output_len != decompressed_size) {
        throw xpq_exception::corrupted_file(seastar::format(
                "snappy page decompresses to {}B, page header says {}B", decompressed_size, output_len));
    }
    if (!snappy::RawUncompress(
            reinterpret_cast<const char*>(input),
            input_len,
            reinterpret_cast<char*>(output))) {
        throw xpq_exception::corrupted_file("could not decompress snappy page");
    }
}

// Accepts both zlib and gzip framing.
void zlib_decompress(const uint8_t* input, size_t input_len, uint8_t* output, size_t output_len) {
    constexpr int DETECT_CODEC = 32;
    constexpr int WINDOW_BITS = 15;

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input);
    stream.avail_in = static_cast<uInt>(input_len);
    stream.next_out = output;
    stream.avail_out = static_cast<uInt>(output_len);

    if (inflateInit2(&stream, DETECT_CODEC | WINDOW_BITS) != Z_OK) {
        throw xpq_exception("could not initialize zlib");
    }
    int err = inflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    inflateEnd(&stream);

    if (err != Z_STREAM_END) {
        throw xpq_exception::corrupted_file(seastar::format("could not decompress gzip page: zlib error {}", err));
    }
    if (produced != output_len) {
        throw xpq_exception::corrupted_file(seastar::format(
                "gzip page decompresses to {}B, page header says {}B", produced, output_len));
    }
}

} // namespace xpq::compression
