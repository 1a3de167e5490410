/**
 * @file solver.hpp
 * @brief Внешний решатель proof-of-work
 *
 * Решатель - отдельный процесс. Протокол обмена через stdin/stdout:
 *
 * @code
 * stdin:  threads (u8) | difficulty (32) | { challenge (32) | authority (32) }*
 * stdout: { hash (32) | nonce (u64 LE) }*
 * @endcode
 *
 * На каждую пару (challenge, authority) решатель выдаёт ровно одну запись,
 * в том же порядке.
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/pubkey.hpp"

#include <filesystem>
#include <span>
#include <stop_token>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Задача для одного ключа
 */
struct SolveRequest {
    /// @brief Текущий challenge proof аккаунта
    Hash256 challenge{};
    /// @brief Владелец proof аккаунта
    ledger::Pubkey authority;
};

/**
 * @brief Найденное решение
 */
struct SolveResult {
    Hash256 hash{};
    uint64_t nonce = 0;

    bool operator==(const SolveResult&) const = default;
};

/// @brief Размер одной записи вывода решателя
inline constexpr std::size_t SOLVE_RECORD_SIZE = 32 + 8;

/**
 * @brief Сформировать stdin решателя
 */
[[nodiscard]] Bytes encode_solver_input(
    uint8_t threads,
    const Hash256& difficulty,
    std::span<const SolveRequest> requests
);

/**
 * @brief Разобрать stdout решателя
 *
 * @param expected Ожидаемое количество записей
 * @return Решения по порядку или MiningSolverFailed, если размер вывода
 *         не равен expected * SOLVE_RECORD_SIZE
 */
[[nodiscard]] Result<std::vector<SolveResult>> decode_solver_output(
    ByteSpan output,
    std::size_t expected
);

/**
 * @brief Решатель proof-of-work
 */
class ProofSolver {
public:
    virtual ~ProofSolver() = default;

    /**
     * @brief Найти решения для всех задач
     *
     * @param stop Запрос остановки прерывает решение с ошибкой
     * @return Решения в порядке задач
     */
    [[nodiscard]] virtual Result<std::vector<SolveResult>> solve(
        std::stop_token stop,
        const Hash256& difficulty,
        std::span<const SolveRequest> requests
    ) = 0;
};

/**
 * @brief Решатель в дочернем процессе (fork/exec + pipes)
 */
class ProcessSolver final : public ProofSolver {
public:
    /**
     * @param executable Путь к исполняемому файлу решателя
     * @param threads Количество потоков (0 для GPU решателя)
     */
    ProcessSolver(std::filesystem::path executable, uint8_t threads);

    [[nodiscard]] Result<std::vector<SolveResult>> solve(
        std::stop_token stop,
        const Hash256& difficulty,
        std::span<const SolveRequest> requests
    ) override;

    [[nodiscard]] const std::filesystem::path& executable() const noexcept { return executable_; }

private:
    std::filesystem::path executable_;
    uint8_t threads_;
};

/**
 * @brief Путь к решателю по умолчанию
 *
 * Если configured не пуст - он же; иначе binary_name в каталоге
 * исполняемого файла.
 */
[[nodiscard]] std::filesystem::path resolve_solver_path(
    std::string_view configured,
    std::string_view binary_name
);

} // namespace bundleminer::mining
