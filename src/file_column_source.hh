#pragma once

#include <xpq/column_chunk_reader.hh>
#include <xpq/record_reader.hh>

#include <string>
#include <vector>

namespace xpq {

// Adapts a column_chunk_reader to the triplet interface of the row assembler.
// Must be used from a seastar thread.
template <format::Type::type T>
class file_column_source final : public record::column_source {
    using output_type = typename column_chunk_reader<T>::output_type;
    static constexpr size_t batch_size = 1024;
    column_chunk_reader<T> _reader;
    std::vector<int16_t> _def_levels;
    std::vector<int16_t> _rep_levels;
    std::vector<output_type> _values;
    size_t _levels_buffered = 0;
    size_t _levels_offset = 0;
    size_t _values_offset = 0;
    bool _closed = false;
private:
    static record::scalar_data convert(output_type&& v) {
        if constexpr (T == format::Type::BOOLEAN) {
            return static_cast<bool>(v);
        } else if constexpr (T == format::Type::BYTE_ARRAY || T == format::Type::FIXED_LEN_BYTE_ARRAY) {
            return std::string(reinterpret_cast<const char*>(v.get()), v.size());
        } else {
            return v;
        }
    }
public:
    explicit file_column_source(column_chunk_reader<T>&& reader)
        : _reader{std::move(reader)}
        , _def_levels(batch_size)
        , _rep_levels(batch_size)
        , _values(batch_size) {}

    bool next(record::triplet& out) override {
        if (_levels_offset == _levels_buffered) {
            if (_closed) {
                return false;
            }
            _levels_buffered = _reader.read_batch(
                    batch_size, _def_levels.data(), _rep_levels.data(), _values.data()).get0();
            _levels_offset = 0;
            _values_offset = 0;
            if (_levels_buffered == 0) {
                close();
                return false;
            }
        }
        out.def_level = _def_levels[_levels_offset];
        out.rep_level = _rep_levels[_levels_offset];
        if (out.def_level == static_cast<int16_t>(_reader.def_level())) {
            out.value = convert(std::move(_values[_values_offset++]));
        } else {
            out.value.reset();
        }
        ++_levels_offset;
        return true;
    }

    void close() override {
        if (!_closed) {
            _closed = true;
            _reader.close().get();
        }
    }
};

} // namespace xpq
