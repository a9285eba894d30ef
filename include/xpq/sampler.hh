#pragma once

#include <xpq/exception.hh>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace xpq {

// Uniform sample of fixed capacity over a stream of unknown length (Algorithm R).
// After n offers every item is in the reservoir with probability min(1, capacity / n).
template <typename T>
class reservoir_sampler {
    size_t _capacity;
    uint64_t _seen = 0;
    std::mt19937_64 _random;
    std::vector<T> _reservoir;
public:
    reservoir_sampler(size_t capacity, uint64_t seed)
        : _capacity{capacity}
        , _random{seed} {
        _reservoir.reserve(std::min<size_t>(capacity, 4096));
    }

    void offer(T item) {
        ++_seen;
        if (_reservoir.size() < _capacity) {
            _reservoir.push_back(std::move(item));
            return;
        }
        uint64_t slot = std::uniform_int_distribution<uint64_t>{1, _seen}(_random);
        if (slot <= _capacity) {
            _reservoir[slot - 1] = std::move(item);
        }
    }

    uint64_t seen() const { return _seen; }
    // Items in reservoir slot order.
    std::vector<T> release() && { return std::move(_reservoir); }
};

// Draws k rows from source, which is anything with a read_one() returning std::optional.
// The same seed over the same stream gives the same sample.
template <typename Source>
auto sample(Source& source, int64_t k, uint64_t seed) {
    using row_type = typename decltype(source.read_one())::value_type;
    if (k < 0) {
        throw invalid_sample_size(seastar::format("sample size must not be negative, got {}", k));
    }
    if (k == 0) {
        return std::vector<row_type>{};
    }
    reservoir_sampler<row_type> sampler{static_cast<size_t>(k), seed};
    while (auto row = source.read_one()) {
        sampler.offer(std::move(*row));
    }
    return std::move(sampler).release();
}

} // namespace xpq
