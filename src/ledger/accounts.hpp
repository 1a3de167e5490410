/**
 * @file accounts.hpp
 * @brief Состояние программы майнинга, читаемое из леджера
 *
 * Все аккаунты программы начинаются с 8-байтного дискриминатора,
 * далее поля в little-endian.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "pubkey.hpp"

#include <array>
#include <chrono>
#include <vector>

namespace bundleminer::ledger {

/**
 * @brief Глобальные параметры майнинга
 */
struct Treasury {
    uint64_t bump = 0;
    Pubkey admin;
    Hash256 difficulty{};

    /// @brief Время начала текущей эпохи (unix секунды)
    int64_t last_reset_at = 0;

    /// @brief Награда за одно решение (минимальные единицы токена)
    uint64_t reward_rate = 0;

    uint64_t total_claimed_rewards = 0;
};

/**
 * @brief Системное время леджера (Clock sysvar)
 */
struct Clock {
    uint64_t slot = 0;
    int64_t epoch_start_timestamp = 0;
    uint64_t epoch = 0;
    uint64_t leader_schedule_epoch = 0;
    int64_t unix_timestamp = 0;
};

/**
 * @brief Bus - пул наград, из которого выплачиваются решения
 */
struct Bus {
    uint64_t id = 0;
    uint64_t rewards = 0;

    auto operator<=>(const Bus&) const = default;
};

/**
 * @brief Состояние майнинга одного ключа
 */
struct Proof {
    Pubkey authority;

    /// @brief Накопленная награда, доступная для вывода
    uint64_t claimable_rewards = 0;

    /// @brief Текущий challenge
    Hash256 hash{};

    uint64_t total_hashes = 0;
    uint64_t total_rewards = 0;
};

/**
 * @brief Снимок состояния цепочки на один цикл
 *
 * Запрашивается заново каждый цикл и не изменяется.
 */
struct ChainSnapshot {
    Treasury treasury;
    Clock clock;
    std::vector<Bus> buses;
};

// =============================================================================
// Декодирование
// =============================================================================

/// @brief Размер данных Treasury (с дискриминатором)
inline constexpr std::size_t TREASURY_SIZE = 8 + 8 + 32 + 32 + 8 + 8 + 8;

/// @brief Размер данных Bus (с дискриминатором)
inline constexpr std::size_t BUS_SIZE = 8 + 8 + 8;

/// @brief Размер данных Proof (с дискриминатором)
inline constexpr std::size_t PROOF_SIZE = 8 + 32 + 8 + 32 + 8 + 8;

/// @brief Размер Clock sysvar
inline constexpr std::size_t CLOCK_SIZE = 40;

[[nodiscard]] Result<Treasury> decode_treasury(ByteSpan data);
[[nodiscard]] Result<Bus> decode_bus(ByteSpan data);
[[nodiscard]] Result<Proof> decode_proof(ByteSpan data);
[[nodiscard]] Result<Clock> decode_clock(ByteSpan data);

/**
 * @brief Время до смены эпохи
 *
 * Граница эпохи: treasury.last_reset_at + EPOCH_DURATION. Если граница
 * уже прошла по часам леджера, возвращается ноль: эпоха просрочена и
 * mine отклоняется, пока treasury не сброшен. Циклы майнинга в этом
 * состоянии не запускают решатель и повторяют опрос через error_backoff.
 */
[[nodiscard]] std::chrono::seconds time_to_next_epoch(
    const Treasury& treasury,
    const Clock& clock
) noexcept;

/**
 * @brief Перевести минимальные единицы токена в дробное значение
 */
[[nodiscard]] double amount_to_ui(uint64_t amount) noexcept;

/**
 * @brief Перевести дробное значение токена в минимальные единицы
 */
[[nodiscard]] uint64_t ui_to_amount(double ui_amount) noexcept;

} // namespace bundleminer::ledger
