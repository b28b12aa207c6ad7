// ============================================================================
// JSON Writable Concepts
// ----------------------------------------------------------------------------
//
// Contract for outbound control frames: serialize straight into a
// caller-provided buffer whose size is known before writing.
//
// -----------------------------------------------------------------------------
// 1. StaticJsonWritable
// -----------------------------------------------------------------------------
//
// Maximum serialized size known at compile time:
//   • static constexpr max_json_size() noexcept
//   • std::size_t write_json(char*) const noexcept
//
// Typical example: Ping (nonce is a bounded integer).
//
// -----------------------------------------------------------------------------
// 2. DynamicJsonWritable
// -----------------------------------------------------------------------------
//
// Maximum serialized size depends on runtime data (token, channel id) but is
// computed per instance before writing:
//   • std::size_t max_json_size() const noexcept
//   • std::size_t write_json(char*) const noexcept
//
// Typical examples: Auth, Join.
//
// -----------------------------------------------------------------------------
// 3. JsonWritable
// -----------------------------------------------------------------------------
//
// Either of the above. The session sends any JsonWritable frame through one
// code path without caring how its bound is obtained.
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>

namespace trovowire::core::protocol {

template<typename T>
concept StaticJsonWritable =
    requires(const T& t, char* buffer) {
        { T::max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    }
    &&
    requires {
        // Forces constant-evaluated context
        requires (T::max_json_size() > 0);
    };

template<typename T>
concept DynamicJsonWritable =
    (!StaticJsonWritable<T>)
    &&
    requires(const T& t, char* buffer) {
        { t.max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    };

template<typename T>
concept JsonWritable = StaticJsonWritable<T> || DynamicJsonWritable<T>;

} // namespace trovowire::core::protocol
