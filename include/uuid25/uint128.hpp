#pragma once

#include <cstdint>

namespace uuid25 {

// 128-bit unsigned integer as two 64-bit halves: value = hi * 2^64 + lo.
// Every conversion between two UUID representations passes through this.
struct Uint128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    bool operator==(const Uint128& o) const { return hi == o.hi && lo == o.lo; }
    bool operator!=(const Uint128& o) const { return !(*this == o); }
    bool operator<(const Uint128& o) const {
        return hi < o.hi || (hi == o.hi && lo < o.lo);
    }
};

} // namespace uuid25
