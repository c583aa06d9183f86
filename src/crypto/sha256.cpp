/**
 * @file sha256.cpp
 * @brief Реализация SHA256
 *
 * Алгоритм соответствует FIPS 180-4.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace phlop::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)

[[nodiscard]] inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] inline uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] inline uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] inline uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] inline uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // anonymous namespace

// =============================================================================
// SHA256 Transform
// =============================================================================

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    // Расписание сообщения (message schedule)
    std::array<uint32_t, 64> w;

    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    uint32_t a = state[0];
    uint32_t b = state[1];
    uint32_t c = state[2];
    uint32_t d = state[3];
    uint32_t e = state[4];
    uint32_t f = state[5];
    uint32_t g = state[6];
    uint32_t h = state[7];

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(a) + maj(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a;
    state[1] += b;
    state[2] += c;
    state[3] += d;
    state[4] += e;
    state[5] += f;
    state[6] += g;
    state[7] += h;
}

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

// =============================================================================
// Инкрементальный хешер
// =============================================================================

Sha256::Sha256() noexcept
    : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_len_ = 0;
}

Sha256& Sha256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    if (len == 0) {
        return *this;
    }
    total_len_ += len;

    // Дополняем частично заполненный буфер
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки напрямую из входа
    while (len >= buffer_.size()) {
        sha256_transform(state_, ptr);
        ptr += buffer_.size();
        len -= buffer_.size();
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Sha256& Sha256::update(std::string_view data) noexcept {
    return update(as_bytes(data));
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_len_ * 8;

    // Добавляем 0x80 (1 бит + 7 нулевых битов)
    buffer_[buffered_++] = 0x80;

    if (buffered_ > 56) {
        // Длина не помещается, нужен дополнительный блок
        std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    std::memset(buffer_.data() + buffered_, 0, 56 - buffered_);
    write_be32(buffer_.data() + 56, static_cast<uint32_t>(bit_len >> 32));
    write_be32(buffer_.data() + 60, static_cast<uint32_t>(bit_len));
    sha256_transform(state_, buffer_.data());

    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

} // namespace phlop::crypto
