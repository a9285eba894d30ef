#include "peekable_stream.hh"

#include <xpq/exception.hh>
#include <xpq/parquet_types.h>

#include <seastar/core/future-util.hh>
#include <seastar/core/print.hh>

#include <cstring>
#include <optional>

namespace xpq {

namespace {

constexpr size_t initial_thrift_window = 1024;
constexpr size_t max_thrift_window = 16 * 1024 * 1024;

// nullopt if data ends before the structure does.
template <typename T>
std::optional<size_t> try_decode_thrift(bytes_view data, T& msg) {
    using apache::thrift::transport::TTransportException;
    msg = T{};
    try {
        return decode_thrift(data, msg);
    } catch (const TTransportException& e) {
        if (e.getType() == TTransportException::END_OF_FILE) {
            return std::nullopt;
        }
        throw xpq_exception::corrupted_file(seastar::format("could not decode thrift structure: {}", e.what()));
    } catch (const apache::thrift::TException& e) {
        throw xpq_exception::corrupted_file(seastar::format("could not decode thrift structure: {}", e.what()));
    }
}

} // namespace

/* Make room for n bytes after _end. The window is rewound in place only once _begin has
 * moved past its middle, otherwise it is reallocated, so every byte is moved at most once
 * and at least half of the allocation stays in use.
 */
void peekable_stream::reserve(size_t n) {
    if (_window.size() - _end >= n) {
        return;
    }
    size_t kept = buffered();
    if (_window.size() >= kept + n && _begin > _window.size() / 2) {
        std::memmove(_window.get_write(), _window.get() + _begin, kept);
    } else {
        seastar::temporary_buffer<uint8_t> grown(std::max(kept + n, _window.size() * 2));
        if (kept > 0) {
            std::memcpy(grown.get_write(), _window.get() + _begin, kept);
        }
        _window = std::move(grown);
    }
    _begin = 0;
    _end = kept;
}

// input_stream::read_exactly drops a short tail at the end of the stream, so reads go through read_up_to.
seastar::future<> peekable_stream::fill(size_t n) {
    size_t target = _end + n;
    return seastar::do_until([this, target] { return _eof || _end >= target; }, [this, target] {
        return _source.read_up_to(target - _end).then([this] (seastar::temporary_buffer<char> chunk) {
            if (chunk.empty()) {
                _eof = true;
                return;
            }
            std::memcpy(_window.get_write() + _end, chunk.get(), chunk.size());
            _end += chunk.size();
        });
    });
}

seastar::future<bytes_view> peekable_stream::peek(size_t n) {
    if (buffered() >= n || _eof) {
        return seastar::make_ready_future<bytes_view>(view(n));
    }
    size_t missing = n - buffered();
    reserve(missing);
    return fill(missing).then([this, n] {
        return view(n);
    });
}

seastar::future<> peekable_stream::advance(size_t n) {
    if (n <= buffered()) {
        _begin += n;
        return seastar::make_ready_future<>();
    }
    size_t rest = n - buffered();
    _begin = _end = 0;
    return _source.skip(rest);
}

/* The size of a thrift structure is only known once it is decoded, so decoding is attempted
 * on a growing window until it succeeds or the window reaches max_thrift_window.
 */
template <typename T>
seastar::future<bool> read_thrift_message(peekable_stream& stream, T& msg) {
    return seastar::do_with(size_t(initial_thrift_window), [&stream, &msg] (size_t& window) {
        return seastar::repeat_until_value([&stream, &msg, &window] {
            using result = std::optional<bool>;
            if (window > max_thrift_window) {
                throw xpq_exception::corrupted_file(seastar::format(
                        "thrift structure larger than the {}B limit", max_thrift_window));
            }
            return stream.peek(window).then([&stream, &msg, &window] (bytes_view available) {
                if (available.empty()) {
                    return seastar::make_ready_future<result>(false);
                }
                std::optional<size_t> used = try_decode_thrift(available, msg);
                if (used) {
                    return stream.advance(*used).then([] {
                        return result(true);
                    });
                }
                if (available.size() < window) {
                    throw xpq_exception::corrupted_file(seastar::format(
                            "unexpected end of stream while decoding a thrift structure ({}B left)",
                            available.size()));
                }
                window *= 2;
                return seastar::make_ready_future<result>();
            });
        });
    });
}

template seastar::future<bool> read_thrift_message(peekable_stream&, format::PageHeader&);
template seastar::future<bool> read_thrift_message(peekable_stream&, format::ColumnMetaData&);

} // namespace xpq
