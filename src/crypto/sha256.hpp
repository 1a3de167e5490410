/**
 * @file sha256.hpp
 * @brief SHA256 поверх OpenSSL EVP
 *
 * Используется для вывода program-derived адресов.
 */

#pragma once

#include "../core/types.hpp"

#include <memory>

namespace bundleminer::crypto {

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 */
[[nodiscard]] Hash256 sha256(ByteSpan data);

/**
 * @brief Инкрементальный SHA256
 *
 * @code
 * Sha256 hasher;
 * hasher.update(seed);
 * hasher.update(program_id);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    // Запрещаем копирование
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    /// @brief Добавить данные
    Sha256& update(ByteSpan data);

    /// @brief Завершить вычисление (повторное использование объекта не допускается)
    [[nodiscard]] Hash256 finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bundleminer::crypto
