#include <uuid25/uuid25.hpp>
#include <uuid25/codec.hpp>
#include <uuid25/log.hpp>
#include <algorithm>

namespace uuid25 {

// 2^128 - 1. Equal-length strings over the same ordered alphabet sort like
// their numeric values, so a plain string comparison is a range check.
static const char max_uuid25[] = "f5lxx1zz5pnorynqglhzmsp33";

static const char urn_prefix[] = "urn:uuid:";

static char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Validates the 8-4-4-4-12 layout starting at `offset` and collects the 32 hex
// digits into `hex`. Does not look outside [offset, offset + 36).
static bool scan_hyphenated(const std::string& s, size_t offset, std::string& hex) {
    if (s.size() < offset + 36) return false;
    hex.clear();
    hex.reserve(32);
    for (size_t i = 0; i < 36; ++i) {
        char c = s[offset + i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else {
            if (codec::hex_value(c) < 0) return false;
            hex += c;
        }
    }
    return true;
}

// ---- Parsing ----

Result<Uuid25> Uuid25::parse(const std::string& s) {
    switch (s.size()) {
        case 25: return parse_uuid25(s);
        case 32: return parse_hex(s);
        case 36: return parse_hyphenated(s);
        case 38: return parse_braced(s);
        case 45: return parse_urn(s);
    }
    log::trace("no UUID format has length %zu", s.size());
    return Uuid25Error::parse_error();
}

Result<Uuid25> Uuid25::parse(const std::string& s, Format f) {
    switch (f) {
        case Format::Uuid25:     return parse_uuid25(s);
        case Format::Hex:        return parse_hex(s);
        case Format::Hyphenated: return parse_hyphenated(s);
        case Format::Braced:     return parse_braced(s);
        case Format::Urn:        return parse_urn(s);
    }
    return Uuid25Error::parse_error();
}

Result<Uuid25> Uuid25::parse_uuid25(const std::string& s) {
    if (s.size() != 25) return Uuid25Error::parse_error();

    std::string value;
    value.reserve(25);
    for (char c : s) {
        if (codec::base36_value(c) < 0) {
            log::trace("rejecting uuid25 input: invalid digit");
            return Uuid25Error::parse_error();
        }
        value += to_lower(c);
    }
    if (value > max_uuid25) {
        log::trace("rejecting uuid25 input: exceeds 128 bits");
        return Uuid25Error::parse_error();
    }
    return Result<Uuid25>::ok(Uuid25(std::move(value)));
}

Result<Uuid25> Uuid25::parse_hex(const std::string& s) {
    if (s.size() != 32) return Uuid25Error::parse_error();
    for (char c : s) {
        if (codec::hex_value(c) < 0) {
            log::trace("rejecting hex input: invalid digit");
            return Uuid25Error::parse_error();
        }
    }
    return Result<Uuid25>::ok(from_uint128(codec::decode_hex(s)));
}

Result<Uuid25> Uuid25::parse_hyphenated(const std::string& s) {
    std::string hex;
    if (s.size() != 36 || !scan_hyphenated(s, 0, hex)) {
        log::trace("rejecting hyphenated input");
        return Uuid25Error::parse_error();
    }
    return Result<Uuid25>::ok(from_uint128(codec::decode_hex(hex)));
}

Result<Uuid25> Uuid25::parse_braced(const std::string& s) {
    std::string hex;
    if (s.size() != 38 || s.front() != '{' || s.back() != '}' ||
        !scan_hyphenated(s, 1, hex)) {
        log::trace("rejecting braced input");
        return Uuid25Error::parse_error();
    }
    return Result<Uuid25>::ok(from_uint128(codec::decode_hex(hex)));
}

Result<Uuid25> Uuid25::parse_urn(const std::string& s) {
    const size_t prefix_len = sizeof(urn_prefix) - 1;
    if (s.size() != prefix_len + 36) return Uuid25Error::parse_error();

    for (size_t i = 0; i < prefix_len; ++i) {
        if (to_lower(s[i]) != urn_prefix[i]) {
            log::trace("rejecting urn input: bad prefix");
            return Uuid25Error::parse_error();
        }
    }
    std::string hex;
    if (!scan_hyphenated(s, prefix_len, hex)) {
        log::trace("rejecting urn input");
        return Uuid25Error::parse_error();
    }
    return Result<Uuid25>::ok(from_uint128(codec::decode_hex(hex)));
}

// ---- Binary and integer forms ----

Result<Uuid25> Uuid25::from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != 16) {
        return Uuid25Error::length_error();
    }
    std::array<uint8_t, 16> arr;
    std::copy(bytes.begin(), bytes.end(), arr.begin());
    return Result<Uuid25>::ok(from_bytes(arr));
}

Uuid25 Uuid25::from_bytes(const std::array<uint8_t, 16>& bytes) {
    return from_uint128(codec::bytes_to_int(bytes));
}

Uuid25 Uuid25::from_uint128(const Uint128& n) {
    return Uuid25(codec::encode_uuid25(n));
}

Uuid25 Uuid25::from_uuid(const Uuid& uuid) {
    return from_uint128(uuid.to_uint128());
}

Uuid25 Uuid25::gen_v4() {
    return from_uuid(Uuid::v4());
}

std::array<uint8_t, 16> Uuid25::to_bytes() const {
    return codec::int_to_bytes(to_uint128());
}

Uint128 Uuid25::to_uint128() const {
    return codec::decode_uuid25(value_);
}

Uuid Uuid25::to_uuid() const {
    return Uuid::from_uint128(to_uint128());
}

// ---- Formatting ----

std::string Uuid25::to_string(Format f) const {
    switch (f) {
        case Format::Uuid25:     return value_;
        case Format::Hex:        return to_hex();
        case Format::Hyphenated: return to_hyphenated();
        case Format::Braced:     return to_braced();
        case Format::Urn:        return to_urn();
    }
    return value_;
}

std::string Uuid25::to_hex() const {
    return codec::encode_hex(to_uint128());
}

std::string Uuid25::to_hyphenated() const {
    return codec::encode_hyphenated(to_uint128());
}

std::string Uuid25::to_braced() const {
    return "{" + to_hyphenated() + "}";
}

std::string Uuid25::to_urn() const {
    return urn_prefix + to_hyphenated();
}

} // namespace uuid25
