#include <uuid25/codec.hpp>
#include <cassert>

namespace uuid25::codec {

static const char hex_chars[] = "0123456789abcdef";
static const char base36_chars[] = "0123456789abcdefghijklmnopqrstuvwxyz";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base36_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

// ---- Bytes ----

Uint128 bytes_to_int(const std::array<uint8_t, 16>& bytes) {
    Uint128 n;
    for (int i = 0; i < 8; ++i) {
        n.hi = (n.hi << 8) | bytes[i];
        n.lo = (n.lo << 8) | bytes[i + 8];
    }
    return n;
}

std::array<uint8_t, 16> int_to_bytes(const Uint128& n) {
    std::array<uint8_t, 16> bytes;
    for (int i = 0; i < 8; ++i) {
        bytes[7 - i] = static_cast<uint8_t>(n.hi >> (i * 8));
        bytes[15 - i] = static_cast<uint8_t>(n.lo >> (i * 8));
    }
    return bytes;
}

// ---- Base36 ----
// Work on the big-endian byte form: repeated in-place division by 36
// yields the digits least significant first.

static uint8_t div_by_36(std::array<uint8_t, 16>& num) {
    uint32_t carry = 0;
    for (auto& b : num) {
        uint32_t cur = carry * 256 + b;
        b = static_cast<uint8_t>(cur / 36);
        carry = cur % 36;
    }
    return static_cast<uint8_t>(carry);
}

// Returns the carry out of the most significant byte (non-zero on overflow).
static uint32_t mul_add_36(std::array<uint8_t, 16>& num, uint8_t val) {
    uint32_t carry = val;
    for (int i = 15; i >= 0; --i) {
        uint32_t cur = static_cast<uint32_t>(num[i]) * 36 + carry;
        num[i] = static_cast<uint8_t>(cur & 0xFF);
        carry = cur >> 8;
    }
    return carry;
}

std::string encode_uuid25(const Uint128& n) {
    auto work = int_to_bytes(n);

    char buf[25];
    for (int i = 24; i >= 0; --i) {
        buf[i] = base36_chars[div_by_36(work)];
    }
    // 36^25 > 2^128, so 25 digits always exhaust the dividend.
    assert(bytes_to_int(work) == Uint128{});
    return std::string(buf, 25);
}

Uint128 decode_uuid25(const std::string& s) {
    assert(s.size() == 25);

    std::array<uint8_t, 16> work{};
    for (char c : s) {
        int v = base36_value(c);
        assert(v >= 0 && "invalid base36 digit");
        uint32_t overflow = mul_add_36(work, static_cast<uint8_t>(v));
        assert(overflow == 0 && "base36 value exceeds 128 bits");
        (void)overflow;
    }
    return bytes_to_int(work);
}

// ---- Hex ----

static void put_hex(std::string& out, uint64_t v, int digits) {
    for (int i = digits - 1; i >= 0; --i) {
        out += hex_chars[(v >> (i * 4)) & 0x0F];
    }
}

std::string encode_hex(const Uint128& n) {
    std::string out;
    out.reserve(32);
    put_hex(out, n.hi, 16);
    put_hex(out, n.lo, 16);
    return out;
}

Uint128 decode_hex(const std::string& s) {
    assert(s.size() == 32);

    Uint128 n;
    for (size_t i = 0; i < 32; ++i) {
        int v = hex_value(s[i]);
        assert(v >= 0 && "invalid hex digit");
        uint64_t& half = i < 16 ? n.hi : n.lo;
        half = (half << 4) | static_cast<uint64_t>(v);
    }
    return n;
}

std::string encode_hyphenated(const Uint128& n) {
    std::string out;
    out.reserve(36);
    put_hex(out, n.hi >> 32, 8);
    out += '-';
    put_hex(out, (n.hi >> 16) & 0xFFFF, 4);
    out += '-';
    put_hex(out, n.hi & 0xFFFF, 4);
    out += '-';
    put_hex(out, n.lo >> 48, 4);
    out += '-';
    put_hex(out, n.lo & 0xFFFFFFFFFFFFull, 12);
    return out;
}

} // namespace uuid25::codec
