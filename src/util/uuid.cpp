#include <uuid25/uuid.hpp>
#include <uuid25/codec.hpp>
#include <fstream>
#include <random>

namespace uuid25 {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), u.bytes.size());
    // Version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // Variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

Uuid Uuid::from_uint128(const Uint128& n) {
    Uuid u;
    u.bytes = codec::int_to_bytes(n);
    return u;
}

Uint128 Uuid::to_uint128() const {
    return codec::bytes_to_int(bytes);
}

std::string Uuid::to_string() const {
    return codec::encode_hyphenated(to_uint128());
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

} // namespace uuid25
