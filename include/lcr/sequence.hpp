#pragma once

#include <cstdint>


namespace lcr {

// Monotonic counter for request identifiers (single-threaded).
//
// next() hands out start, start+1, ... and last() reports the value most
// recently issued, or start - 1 while nothing has been issued yet.
class sequence {
public:
    explicit constexpr sequence(std::uint64_t start = 1) noexcept
        : next_(start)
    {}

    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    [[nodiscard]] inline std::uint64_t next() noexcept {
        return next_++;
    }

    [[nodiscard]] inline std::uint64_t last() const noexcept {
        return next_ - 1;
    }

private:
    std::uint64_t next_;
};

} // namespace lcr
