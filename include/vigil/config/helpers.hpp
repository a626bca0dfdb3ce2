#pragma once

#include <cstdint>
#include <string_view>

#include "simdjson.h"

/*
================================================================================
Config JSON Helpers
================================================================================

Low-level primitives that extract typed fields from simdjson DOM elements.

  • Return false on a missing required field or a type mismatch
  • Optional fields report presence through an out flag
  • Never allocate, never log, never throw

Value validation (empty names, level spelling) belongs to the config loader.
================================================================================
*/


namespace vigil::config::helper {

[[nodiscard]]
inline bool is_object(const simdjson::dom::element& e) noexcept {
    return e.type() == simdjson::dom::element_type::OBJECT;
}

// ------------------------------------------------------------
// REQUIRED FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_array_required(const simdjson::dom::element& obj, const char* key, simdjson::dom::array& out) noexcept {
    if (!is_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

[[nodiscard]]
inline bool parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (!is_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

[[nodiscard]]
inline bool parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (!is_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

// ------------------------------------------------------------
// OPTIONAL FIELDS
// ------------------------------------------------------------
// Absent -> true with present == false. Present with the wrong type -> false.
[[nodiscard]]
inline bool parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::uint64_t& out, bool& present) noexcept {
    present = false;
    if (!is_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    if (field.get(out)) {
        return false;
    }
    present = true;
    return true;
}

[[nodiscard]]
inline bool parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    if (!is_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    if (field.get(out)) {
        return false;
    }
    present = true;
    return true;
}

} // namespace vigil::config::helper
