#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "simdjson.h"

/*
================================================================================
JSON configuration helpers (low-level primitives)
================================================================================

Extract optional primitive fields from simdjson DOM elements.

Every helper follows the same contract:
  • returns false only when the field is present with the wrong type
  • a missing field is not an error: `present` is cleared and `out` untouched
  • never logs, never throws, never validates values

Semantic validation belongs to the loader.
================================================================================
*/

namespace flowline::config::helper {

[[nodiscard]]
inline bool require_object(const simdjson::dom::element& root) noexcept {
    return root.type() == simdjson::dom::element_type::OBJECT;
}

[[nodiscard]]
inline bool parse_object_optional(const simdjson::dom::element& parent, const char* key,
                                  simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    auto field = parent[key];
    if (field.error()) {
        return true; // optional, not present
    }
    if (field.get(out) || !require_object(out)) {
        return false;
    }
    present = true;
    return true;
}

[[nodiscard]]
inline bool parse_uint64_optional(const simdjson::dom::element& obj, const char* key,
                                  std::uint64_t& out, bool& present) noexcept {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    std::uint64_t tmp;
    if (field.get(tmp)) {
        return false; // wrong type (or negative)
    }
    out = tmp;
    present = true;
    return true;
}

[[nodiscard]]
inline bool parse_string_optional(const simdjson::dom::element& obj, const char* key,
                                  std::string& out, bool& present) {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return false;
    }
    out.assign(sv.data(), sv.size());
    present = true;
    return true;
}

[[nodiscard]]
inline bool parse_string_list_optional(const simdjson::dom::element& obj, const char* key,
                                       std::vector<std::string>& out, bool& present) {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return false;
    }
    std::vector<std::string> tmp;
    tmp.reserve(arr.size());
    for (auto v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            return false;
        }
        tmp.emplace_back(sv);
    }
    out = std::move(tmp);
    present = true;
    return true;
}

} // namespace flowline::config::helper
