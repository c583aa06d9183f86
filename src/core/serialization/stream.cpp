/**
 * @file stream.cpp
 * @brief Реализация потоков сериализации
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <cstring>
#include <format>

namespace phlop::core::serialization {

// =============================================================================
// ReadStream
// =============================================================================

void ReadStream::ensure_available(std::size_t count) const {
    if (count > data_.size() - pos_) {
        throw StreamError(std::format(
            "Unexpected end of stream: need {} bytes at offset {}, have {}",
            count, pos_, data_.size() - pos_));
    }
}

uint8_t ReadStream::read_u8() {
    ensure_available(1);
    return data_[pos_++];
}

uint32_t ReadStream::read_u32() {
    ensure_available(4);
    uint32_t value = read_le32(data_.data() + pos_);
    pos_ += 4;
    return value;
}

uint64_t ReadStream::read_u64() {
    ensure_available(8);
    uint64_t value = read_le64(data_.data() + pos_);
    pos_ += 8;
    return value;
}

int64_t ReadStream::read_i64() {
    return static_cast<int64_t>(read_u64());
}

uint64_t ReadStream::read_varint() {
    uint8_t first = read_u8();
    if (first < 0xFD) {
        return first;
    }

    uint64_t value = 0;
    uint64_t min_value = 0;
    if (first == 0xFD) {
        ensure_available(2);
        value = static_cast<uint64_t>(data_[pos_]) |
                (static_cast<uint64_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        min_value = 0xFD;
    } else if (first == 0xFE) {
        value = read_u32();
        min_value = 0x10000;
    } else {
        value = read_u64();
        min_value = 0x100000000;
    }

    // Кодирование только минимальной длины
    if (value < min_value) {
        throw StreamError(std::format(
            "Non-canonical VarInt: value {} encoded with prefix 0x{:02X}", value, first));
    }
    return value;
}

Hash256 ReadStream::read_hash256() {
    ensure_available(32);
    Hash256 hash;
    std::memcpy(hash.data(), data_.data() + pos_, 32);
    pos_ += 32;
    return hash;
}

std::string ReadStream::read_string() {
    uint64_t len = read_varint();
    if (len > remaining()) {
        throw StreamError(std::format("String length {} exceeds stream", len));
    }
    std::string result(reinterpret_cast<const char*>(data_.data() + pos_),
                       static_cast<std::size_t>(len));
    pos_ += static_cast<std::size_t>(len);
    return result;
}

std::size_t ReadStream::remaining() const noexcept {
    return data_.size() - pos_;
}

bool ReadStream::eof() const noexcept {
    return pos_ >= data_.size();
}

// =============================================================================
// WriteStream
// =============================================================================

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u32(uint32_t value) {
    uint8_t buf[4];
    write_le32(buf, value);
    data_.insert(data_.end(), buf, buf + 4);
}

void WriteStream::write_u64(uint64_t value) {
    uint8_t buf[8];
    write_le64(buf, value);
    data_.insert(data_.end(), buf, buf + 8);
}

void WriteStream::write_i64(int64_t value) {
    write_u64(static_cast<uint64_t>(value));
}

void WriteStream::write_varint(uint64_t value) {
    if (value < 0xFD) {
        write_u8(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        write_u8(0xFD);
        write_u8(static_cast<uint8_t>(value));
        write_u8(static_cast<uint8_t>(value >> 8));
    } else if (value <= 0xFFFFFFFF) {
        write_u8(0xFE);
        write_u32(static_cast<uint32_t>(value));
    } else {
        write_u8(0xFF);
        write_u64(value);
    }
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

void WriteStream::write_string(std::string_view str) {
    write_varint(str.size());
    write_bytes(as_bytes(str));
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

} // namespace phlop::core::serialization
