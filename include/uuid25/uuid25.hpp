#pragma once

#include <uuid25/format.hpp>
#include <uuid25/result.hpp>
#include <uuid25/uint128.hpp>
#include <uuid25/uuid.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace uuid25 {

// A UUID held in the 25-digit case-insensitive Base36 representation.
//
// Every live instance stores exactly 25 lowercase characters over [0-9a-z]
// whose numeric value is at most 2^128 - 1. Instances are only created
// through the validating factories below and never change afterwards.
class Uuid25 {
public:
    // ---- Parsing ----

    // Accepts any of the five textual formats, chosen by input length alone:
    // 25 -> uuid25, 32 -> hex, 36 -> hyphenated, 38 -> braced, 45 -> urn.
    static Result<Uuid25> parse(const std::string& s);
    // Accepts only the given format.
    static Result<Uuid25> parse(const std::string& s, Format f);

    // 3ud3gtvgolimgu9lah6aie99o
    static Result<Uuid25> parse_uuid25(const std::string& s);
    // 40eb9860cf3e45e2a90eb82236ac806c
    static Result<Uuid25> parse_hex(const std::string& s);
    // 40eb9860-cf3e-45e2-a90e-b82236ac806c
    static Result<Uuid25> parse_hyphenated(const std::string& s);
    // {40eb9860-cf3e-45e2-a90e-b82236ac806c}
    static Result<Uuid25> parse_braced(const std::string& s);
    // urn:uuid:40eb9860-cf3e-45e2-a90e-b82236ac806c
    static Result<Uuid25> parse_urn(const std::string& s);

    // ---- Binary and integer forms ----

    // Fails with a Length error unless bytes.size() == 16.
    static Result<Uuid25> from_bytes(const std::vector<uint8_t>& bytes);
    static Uuid25 from_bytes(const std::array<uint8_t, 16>& bytes);
    static Uuid25 from_uint128(const Uint128& n);
    static Uuid25 from_uuid(const Uuid& uuid);

    // Random version 4 UUID.
    static Uuid25 gen_v4();

    std::array<uint8_t, 16> to_bytes() const;
    Uint128 to_uint128() const;
    Uuid to_uuid() const;

    // ---- Formatting ----

    const std::string& value() const { return value_; }
    const std::string& to_string() const { return value_; }
    std::string to_string(Format f) const;
    std::string to_hex() const;
    std::string to_hyphenated() const;
    std::string to_braced() const;
    std::string to_urn() const;

    // ---- Comparison ----
    // A raw string operand is compared as-is: it is assumed to already be in
    // canonical form and is neither validated nor lowercased.

    bool equals(const Uuid25& other) const { return value_ == other.value_; }
    bool equals(const std::string& other) const { return value_ == other; }
    int compare(const Uuid25& other) const { return value_.compare(other.value_); }
    int compare(const std::string& other) const { return value_.compare(other); }
    // Same as std::hash<std::string> of the canonical string.
    size_t hash() const { return std::hash<std::string>{}(value_); }

private:
    explicit Uuid25(std::string canonical) : value_(std::move(canonical)) {}

    std::string value_;
};

inline bool operator==(const Uuid25& a, const Uuid25& b) { return a.equals(b); }
inline bool operator!=(const Uuid25& a, const Uuid25& b) { return !a.equals(b); }
inline bool operator<(const Uuid25& a, const Uuid25& b) { return a.compare(b) < 0; }
inline bool operator<=(const Uuid25& a, const Uuid25& b) { return a.compare(b) <= 0; }
inline bool operator>(const Uuid25& a, const Uuid25& b) { return a.compare(b) > 0; }
inline bool operator>=(const Uuid25& a, const Uuid25& b) { return a.compare(b) >= 0; }

inline bool operator==(const Uuid25& a, const std::string& b) { return a.equals(b); }
inline bool operator!=(const Uuid25& a, const std::string& b) { return !a.equals(b); }
inline bool operator<(const Uuid25& a, const std::string& b) { return a.compare(b) < 0; }
inline bool operator<=(const Uuid25& a, const std::string& b) { return a.compare(b) <= 0; }
inline bool operator>(const Uuid25& a, const std::string& b) { return a.compare(b) > 0; }
inline bool operator>=(const Uuid25& a, const std::string& b) { return a.compare(b) >= 0; }

inline bool operator==(const std::string& a, const Uuid25& b) { return b.equals(a); }
inline bool operator!=(const std::string& a, const Uuid25& b) { return !b.equals(a); }
inline bool operator<(const std::string& a, const Uuid25& b) { return b.compare(a) > 0; }
inline bool operator<=(const std::string& a, const Uuid25& b) { return b.compare(a) >= 0; }
inline bool operator>(const std::string& a, const Uuid25& b) { return b.compare(a) < 0; }
inline bool operator>=(const std::string& a, const Uuid25& b) { return b.compare(a) <= 0; }

inline std::ostream& operator<<(std::ostream& os, const Uuid25& u) {
    return os << u.value();
}

} // namespace uuid25

namespace std {

template<>
struct hash<uuid25::Uuid25> {
    size_t operator()(const uuid25::Uuid25& u) const { return u.hash(); }
};

} // namespace std
