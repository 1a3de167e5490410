/**
 * @file byte_order.hpp
 * @brief Чтение и запись little-endian полей
 *
 * Данные аккаунтов леджера, инструкции программ и протокол внешнего
 * решателя используют little-endian для всех числовых полей.
 * Длины массивов в формате транзакции кодируются как compact-u16
 * (7 бит на байт, старший бит - признак продолжения).
 */

#pragma once

#include "types.hpp"

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>

namespace bundleminer {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

// =============================================================================
// Преобразование порядка байт
// =============================================================================

/**
 * @brief Преобразовать число из формата хоста в little-endian
 *
 * На little-endian системах ничего не делает.
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

template<UnsignedInteger T>
[[nodiscard]] constexpr T from_little_endian(T value) noexcept {
    return to_little_endian(value);
}

// =============================================================================
// Чтение/запись из/в байтовый массив
// =============================================================================

/**
 * @brief Прочитать целое little-endian из буфера
 *
 * @param src Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
[[nodiscard]] inline T read_le(const uint8_t* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(value));
    return from_little_endian(value);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    return read_le<uint64_t>(src);
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    return read_le<uint32_t>(src);
}

/// @brief Знаковое 64-битное поле (timestamp в Clock/Treasury)
[[nodiscard]] inline int64_t read_le64_signed(const uint8_t* src) noexcept {
    return static_cast<int64_t>(read_le<uint64_t>(src));
}

/**
 * @brief Записать целое в little-endian формате
 *
 * @param dest Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
inline void write_le(uint8_t* dest, T value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Дописать целое в конец буфера в little-endian формате
 */
template<UnsignedInteger T>
inline void append_le(Bytes& out, T value) {
    const auto offset = out.size();
    out.resize(offset + sizeof(T));
    write_le(out.data() + offset, value);
}

/**
 * @brief Дописать массив байт в конец буфера
 */
template<ByteContainer C>
inline void append_bytes(Bytes& out, const C& data) {
    out.insert(out.end(), data.data(), data.data() + data.size());
}

// =============================================================================
// compact-u16
// =============================================================================

/**
 * @brief Дописать длину в формате compact-u16
 *
 * Значения до 0x7f занимают 1 байт, до 0x3fff - 2 байта, иначе 3 байта.
 */
inline void append_compact_u16(Bytes& out, uint16_t value) {
    uint16_t rem = value;
    while (true) {
        auto elem = static_cast<uint8_t>(rem & 0x7f);
        rem >>= 7;
        if (rem == 0) {
            out.push_back(elem);
            break;
        }
        out.push_back(static_cast<uint8_t>(elem | 0x80));
    }
}

/**
 * @brief Прочитать compact-u16
 *
 * @param data Буфер
 * @param offset Смещение (сдвигается на число прочитанных байт)
 * @return Значение или std::nullopt при некорректной кодировке
 */
[[nodiscard]] inline std::optional<uint16_t> read_compact_u16(
    ByteSpan data, std::size_t& offset
) noexcept {
    uint32_t value = 0;
    for (unsigned shift = 0; shift < 21; shift += 7) {
        if (offset >= data.size()) {
            return std::nullopt;
        }
        const uint8_t byte = data[offset++];
        value |= static_cast<uint32_t>(byte & 0x7f) << shift;
        if ((byte & 0x80) == 0) {
            if (value > 0xffff) {
                return std::nullopt;
            }
            return static_cast<uint16_t>(value);
        }
    }
    return std::nullopt;
}

} // namespace bundleminer
