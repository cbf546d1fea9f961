#include <uuid25/format.hpp>

namespace uuid25 {

const char* format_name(Format f) {
    switch (f) {
        case Format::Uuid25:     return "uuid25";
        case Format::Hex:        return "hex";
        case Format::Hyphenated: return "hyphenated";
        case Format::Braced:     return "braced";
        case Format::Urn:        return "urn";
    }
    return "unknown";
}

Result<Format> parse_format_name(const std::string& name) {
    for (Format f : {Format::Uuid25, Format::Hex, Format::Hyphenated,
                     Format::Braced, Format::Urn}) {
        if (name == format_name(f)) {
            return Result<Format>::ok(f);
        }
    }
    return Uuid25Error{Uuid25Error::Config,
        "unknown UUID format '" + name + "'",
        "expected one of: uuid25, hex, hyphenated, braced, urn"};
}

size_t format_length(Format f) {
    switch (f) {
        case Format::Uuid25:     return 25;
        case Format::Hex:        return 32;
        case Format::Hyphenated: return 36;
        case Format::Braced:     return 38;
        case Format::Urn:        return 45;
    }
    return 0;
}

} // namespace uuid25
