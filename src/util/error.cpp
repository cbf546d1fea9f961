#include <uuid25/error.hpp>

namespace uuid25 {

Uuid25Error Uuid25Error::parse_error() {
    return Uuid25Error(Parse, "could not parse a UUID string");
}

Uuid25Error Uuid25Error::length_error() {
    return Uuid25Error(Length, "the length of byte array must be 16");
}

const char* Uuid25Error::code_name(Code c) {
    switch (c) {
        case Parse:  return "Parse";
        case Length: return "Length";
        case Config: return "Config";
        case IO:     return "IO";
    }
    return "Unknown";
}

std::string Uuid25Error::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace uuid25
