#pragma once

#include <xpq/io.hh>

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include <algorithm>

namespace xpq {

// An input stream that can look ahead. Page headers are decoded from a window
// which usually extends into the page after them, and the unconsumed tail of the
// window is kept contiguous with what is read next.
class peekable_stream {
    seastar::input_stream<char> _source;
    seastar::temporary_buffer<uint8_t> _window;
    size_t _begin = 0;
    size_t _end = 0;
    bool _eof = false;
private:
    size_t buffered() const { return _end - _begin; }
    bytes_view view(size_t n) const { return {_window.get() + _begin, std::min(n, buffered())}; }
    void reserve(size_t n);
    seastar::future<> fill(size_t n);
public:
    explicit peekable_stream(seastar::input_stream<char>&& source)
        : _source{std::move(source)} {}

    // The next min(n, k) unconsumed bytes, k being the number of bytes left in the stream.
    seastar::future<bytes_view> peek(size_t n);
    seastar::future<> advance(size_t n);
    seastar::future<> close() { return _source.close(); }
};

// Decodes one thrift structure from the front of stream and consumes it.
// Resolves to false if the stream is empty.
template <typename T>
seastar::future<bool> read_thrift_message(peekable_stream& stream, T& msg);

} // namespace xpq
