#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "trovowire/core/protocol/trovo/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Trovo JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the Trovo parsers to extract primitive values from
simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structure (object presence, type correctness)
  • Parse primitive field types (integer, string, string list)
  • Provide the optional-field semantics the platform requires

Optional-field semantics:
  • A missing key and an explicit JSON null are the same thing: "absent".
    Both return Parsed with the output reset.
  • A present, non-null value of the wrong type is InvalidSchema.

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace trovowire::core::protocol::trovo::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// Looks up an optional key. Returns false when the key is missing or null.
[[nodiscard]]
inline bool lookup_present(const simdjson::dom::element& obj, const char* key, simdjson::dom::element& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return false;
    }
    out = field.value_unsafe();
    return !out.is_null();
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!lookup_present(parent, key, out)) {
        return Result::Parsed; // optional, not present
    }
    if (require_object(out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// OPTIONAL ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_present(parent, key, field)) {
        return Result::Parsed; // optional, not present
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    auto r = parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS (missing or null → absent)
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    // Always reset output (streaming safety)
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_present(obj, key, field)) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.emplace(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_present(obj, key, field)) {
        return Result::Parsed;
    }
    std::uint64_t tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_present(obj, key, field)) {
        return Result::Parsed;
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

// Missing or null list → empty list.
[[nodiscard]]
inline Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out) noexcept {
    out.clear();
    simdjson::dom::array arr;
    bool present = false;
    auto r = parse_array_optional(obj, key, arr, present);
    if (r != Result::Parsed || !present) {
        return r;
    }
    for (auto v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            return Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    return Result::Parsed;
}

// Keeps a present, non-null value as its minified JSON text.
[[nodiscard]]
inline Result parse_raw_json_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_present(obj, key, field)) {
        return Result::Parsed;
    }
    out = simdjson::minify(field);
    return Result::Parsed;
}

} // namespace trovowire::core::protocol::trovo::parser::helper
