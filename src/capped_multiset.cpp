// src/capped_multiset.cpp
#include "capped_multiset.hpp"
#include <algorithm>
#include <limits>
#include <utility>

CappedMultiset::CappedMultiset(std::vector<uint64_t> values)
    : values_(std::move(values))
{
    std::sort(values_.begin(), values_.end());
    prefix_sums_.reserve(values_.size());

    uint64_t running = 0;
    for (size_t i = 0; i < values_.size(); ++i) {
        // capped sums never exceed the total, so checking here covers sum() too
        if (values_[i] > std::numeric_limits<uint64_t>::max() - running) {
            throw InvalidInput("CappedMultiset: total of values overflows uint64 at element "
                               + std::to_string(i));
        }
        running += values_[i];
        prefix_sums_.push_back(running);
    }
}

CappedMultiset CappedMultiset::from_signed(const std::vector<int64_t> &values) {
    std::vector<uint64_t> out;
    out.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < 0) {
            throw InvalidInput("CappedMultiset: negative value " + std::to_string(values[i])
                               + " at index " + std::to_string(i));
        }
        out.push_back(static_cast<uint64_t>(values[i]));
    }
    return CappedMultiset(std::move(out));
}

uint64_t CappedMultiset::sum() const noexcept {
    if (!cap_) return total();

    const uint64_t c = *cap_;
    // k = number of elements strictly below the cap; the rest contribute exactly c
    auto it = std::lower_bound(values_.begin(), values_.end(), c);
    size_t k = static_cast<size_t>(it - values_.begin());

    uint64_t below = (k == 0) ? 0 : prefix_sums_[k - 1];
    return below + c * static_cast<uint64_t>(values_.size() - k);
}

size_t CappedMultisetHash::operator()(const CappedMultiset &m) const noexcept {
    // FNV-1a over the 8-byte words, then a final mix
    uint64_t h = 14695981039346656037ULL;
    auto mix = [&h](uint64_t w) {
        for (int b = 0; b < 8; ++b) {
            h ^= (w >> (8 * b)) & 0xffULL;
            h *= 1099511628211ULL;
        }
    };
    for (uint64_t v : m.values()) mix(v);
    if (m.cap()) {
        mix(1);
        mix(*m.cap());
    } else {
        mix(0);
    }
    h ^= (h >> 33);
    h *= 0xff51afd7ed558ccdULL;
    h ^= (h >> 33);
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= (h >> 33);
    return static_cast<size_t>(h);
}

std::ostream &operator<<(std::ostream &os, const CappedMultiset &m) {
    os << "CappedMultiset{values=[";
    const auto &v = m.values();
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) os << ", ";
        os << v[i];
    }
    os << "], cap=";
    if (m.cap()) os << *m.cap();
    else os << "none";
    os << "}";
    return os;
}
