// src/capped_multiset.hpp
#pragma once
#include <vector>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstddef>

// Raised at construction when the input cannot be a multiset of non-negative counts.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string &what) : std::invalid_argument(what) {}
};

/// CappedMultiset: immutable multiset of non-negative values with a mutable per-element cap.
/// - Values are sorted once and prefix-summed at construction (O(n log n)).
/// - set_cap() is O(1) and never touches the stored values.
/// - sum() returns sum(min(v, cap)) in O(log n), or the plain total when uncapped.
///
/// Not thread-safe: callers sharing an instance must serialize set_cap() against sum().
class CappedMultiset {
public:
    explicit CappedMultiset(std::vector<uint64_t> values = {});

    // Validating constructor for signed input; throws InvalidInput on a negative value.
    static CappedMultiset from_signed(const std::vector<int64_t> &values);

    // std::nullopt removes the cap.
    void set_cap(std::optional<uint64_t> cap) noexcept { cap_ = cap; }
    void clear_cap() noexcept { cap_.reset(); }
    std::optional<uint64_t> cap() const noexcept { return cap_; }

    uint64_t sum() const noexcept;

    // unclamped sum of all values
    uint64_t total() const noexcept { return prefix_sums_.empty() ? 0 : prefix_sums_.back(); }

    size_t size() const noexcept { return values_.size(); }
    bool empty() const noexcept { return values_.empty(); }
    const std::vector<uint64_t> &values() const noexcept { return values_; }

    bool operator==(const CappedMultiset &o) const noexcept {
        return cap_ == o.cap_ && values_ == o.values_;
    }
    bool operator!=(const CappedMultiset &o) const noexcept { return !(*this == o); }

private:
    std::vector<uint64_t> values_;      // sorted ascending
    std::vector<uint64_t> prefix_sums_; // prefix_sums_[i] = values_[0] + ... + values_[i]
    std::optional<uint64_t> cap_;
};

// Hash over sorted values and cap; consistent with operator==.
struct CappedMultisetHash {
    size_t operator()(const CappedMultiset &m) const noexcept;
};

std::ostream &operator<<(std::ostream &os, const CappedMultiset &m);
