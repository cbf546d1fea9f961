#pragma once

#include <uuid25/uint128.hpp>
#include <array>
#include <cstdint>
#include <string>

// Conversions between a 128-bit integer and its external representations.
// Output is always fixed width and lowercase. The decode functions assume
// their input has already been validated; passing anything else is a
// programming error and trips an assertion.
namespace uuid25::codec {

// 25 base-36 digits, most significant first, zero padded.
std::string encode_uuid25(const Uint128& n);
// Precondition: 25 base-36 digits (either case), value <= 2^128 - 1.
Uint128 decode_uuid25(const std::string& s);

// 32 hex digits, zero padded.
std::string encode_hex(const Uint128& n);
// Precondition: 32 hex digits (either case).
Uint128 decode_hex(const std::string& s);

// 8-4-4-4-12 groups of bit widths 32/16/16/16/48.
std::string encode_hyphenated(const Uint128& n);

// Big-endian.
Uint128 bytes_to_int(const std::array<uint8_t, 16>& bytes);
std::array<uint8_t, 16> int_to_bytes(const Uint128& n);

// Digit value, or -1 if c is not a digit of that radix.
int hex_value(char c);
int base36_value(char c);

} // namespace uuid25::codec
