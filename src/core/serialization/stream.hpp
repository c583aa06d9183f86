/**
 * @file stream.hpp
 * @brief Потоки чтения/записи для канонической сериализации
 *
 * Каноническая форма PhlopChain:
 * - целые числа фиксированной ширины, little-endian
 * - строки и последовательности с префиксом длины VarInt (формат Bitcoin)
 * - хеши как 32 сырых байта
 *
 * Порядок полей задаётся вызывающим кодом и никогда не меняется,
 * иначе пересчитанные хеши блоков перестанут совпадать.
 */

#pragma once

#include "../types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phlop::core::serialization {

/**
 * @brief Исключение при ошибке чтения
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Поток для чтения бинарных данных
 */
class ReadStream {
public:
    explicit ReadStream(ByteSpan data) noexcept
        : data_(data), pos_(0) {}

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] uint32_t read_u32();
    [[nodiscard]] uint64_t read_u64();
    [[nodiscard]] int64_t read_i64();

    /**
     * @brief Прочитать VarInt (Bitcoin формат)
     *
     * Принимается только минимальная длина кодирования, иначе StreamError.
     */
    [[nodiscard]] uint64_t read_varint();

    [[nodiscard]] Hash256 read_hash256();

    /**
     * @brief Прочитать строку с префиксом длины (VarInt)
     *
     * @throws StreamError если длина превышает остаток потока
     */
    [[nodiscard]] std::string read_string();

    [[nodiscard]] std::size_t remaining() const noexcept;
    [[nodiscard]] bool eof() const noexcept;

private:
    void ensure_available(std::size_t count) const;

    ByteSpan data_;
    std::size_t pos_;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;

    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);

    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_i64(int64_t value);

    /**
     * @brief Записать VarInt (Bitcoin формат)
     */
    void write_varint(uint64_t value);

    void write_bytes(ByteSpan data);
    void write_hash256(const Hash256& hash);

    /**
     * @brief Записать строку с префиксом длины (VarInt)
     */
    void write_string(std::string_view str);

    [[nodiscard]] const Bytes& data() const noexcept;
    [[nodiscard]] Bytes take_data() noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    Bytes data_;
};

} // namespace phlop::core::serialization
