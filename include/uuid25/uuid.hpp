#pragma once

#include <uuid25/uint128.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace uuid25 {

// Conventional 16-byte UUID object. Uuid25 only talks to it through the
// 128-bit integer contract (to_uint128 / from_uint128).
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // Random version 4, variant 1 UUID.
    static Uuid v4();

    static Uuid from_uint128(const Uint128& n);
    Uint128 to_uint128() const;

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    std::string to_string() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

} // namespace uuid25
