#pragma once
#include <string_view>
#include <cstdint>

namespace lcr {
namespace bit {

// ============================================================================
// pack8
// ============================================================================
//
// Packs the first (up to) 8 chars of a string into a uint64_t (little endian),
// padding with zeros. Two strings of length <= 8 pack to the same value iff
// they are equal, which makes the result usable as a switch label for short
// protocol discriminants:
//
//   switch (lcr::bit::pack8(type)) {
//       case lcr::bit::pack8("CHAT"): ...
//   }
//
// Callers must reject strings longer than 8 chars before switching.

constexpr uint64_t pack8(std::string_view s) noexcept {
    const char* p = s.data();
    return
        (s.size() > 0 ? uint64_t(uint8_t(p[0]))       : 0) |
        (s.size() > 1 ? uint64_t(uint8_t(p[1])) << 8  : 0) |
        (s.size() > 2 ? uint64_t(uint8_t(p[2])) << 16 : 0) |
        (s.size() > 3 ? uint64_t(uint8_t(p[3])) << 24 : 0) |
        (s.size() > 4 ? uint64_t(uint8_t(p[4])) << 32 : 0) |
        (s.size() > 5 ? uint64_t(uint8_t(p[5])) << 40 : 0) |
        (s.size() > 6 ? uint64_t(uint8_t(p[6])) << 48 : 0) |
        (s.size() > 7 ? uint64_t(uint8_t(p[7])) << 56 : 0);
}

} // namespace bit
} // namespace lcr
