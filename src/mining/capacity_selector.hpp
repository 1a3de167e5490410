/**
 * @file capacity_selector.hpp
 * @brief Выбор bus с достаточным запасом наград
 */

#pragma once

#include "../ledger/accounts.hpp"

#include <span>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Отобрать bus, способные выплатить награду
 *
 * Bus пригоден, если rewards >= required. Результат упорядочен по
 * убыванию rewards; bus с равными rewards сохраняют исходный порядок.
 * Пустой результат допустим: в этом цикле отправлять некуда.
 *
 * @code
 * // [{0,100},{1,50},{2,200}], required = 80  ->  [{2,200},{0,100}]
 * @endcode
 */
[[nodiscard]] std::vector<ledger::Bus> select_buses(
    std::span<const ledger::Bus> buses,
    uint64_t required
);

/**
 * @brief Требуемый запас bus для пакета из identity_count ключей
 *
 * reward_rate * (identity_count + headroom), с насыщением при переполнении.
 */
[[nodiscard]] uint64_t required_capacity(
    uint64_t reward_rate,
    std::size_t identity_count,
    std::size_t headroom
) noexcept;

} // namespace bundleminer::mining
