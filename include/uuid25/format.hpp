#pragma once

#include <uuid25/result.hpp>
#include <cstddef>
#include <string>

namespace uuid25 {

// Textual UUID representations understood by the parsers.
enum class Format {
    Uuid25,      // 3ud3gtvgolimgu9lah6aie99o
    Hex,         // 40eb9860cf3e45e2a90eb82236ac806c
    Hyphenated,  // 40eb9860-cf3e-45e2-a90e-b82236ac806c
    Braced,      // {40eb9860-cf3e-45e2-a90e-b82236ac806c}
    Urn,         // urn:uuid:40eb9860-cf3e-45e2-a90e-b82236ac806c
};

const char* format_name(Format f);
Result<Format> parse_format_name(const std::string& name);

// Exact length of a string in the given format.
size_t format_length(Format f);

} // namespace uuid25
