/**
 * @file main.cpp
 * @brief Точка входа bundleminer
 *
 * bundleminer - майнер proof-of-work с отправкой решений пакетами
 * транзакций (bundle) через relay.
 *
 * Основные компоненты:
 * 1. RpcLedger - запросы к леджеру (JSON-RPC)
 * 2. JitoRelay - отправка bundle
 * 3. TipFeed - поток перцентилей tip
 * 4. FixedWorker / PooledScheduler - режимы майнинга
 * 5. ClaimRunner - вывод наград
 * 6. RewardReporter - периодический отчёт
 *
 * Использование:
 *   bundle-miner [options] <command>
 *
 * Команды:
 *   bundle-mine          Фиксированные воркеры (CPU решатель)
 *   bundle-mine-pooled   Пул пакетов (GPU решатель)
 *   claim                Вывод наград
 *   init-claim           Создание token аккаунта получателя
 *   tip-stream           Мониторинг потока tip
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/task_group.hpp"
#include "crypto/keypair.hpp"
#include "ledger/program.hpp"
#include "log/logger.hpp"
#include "mining/claim_runner.hpp"
#include "mining/fixed_worker.hpp"
#include "mining/identity.hpp"
#include "mining/pooled_scheduler.hpp"
#include "mining/resource_pool.hpp"
#include "mining/solver.hpp"
#include "monitoring/metrics.hpp"
#include "monitoring/reward_reporter.hpp"
#include "relay/bundle_relay.hpp"
#include "rpc/rpc_ledger.hpp"
#include "tips/tip_feed.hpp"

#include <curl/curl.h>

#include <atomic>
#include <csignal>
#include <format>
#include <functional>
#include <iostream>
#include <optional>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Интервал вывода снимка в команде tip-stream
constexpr auto TIP_STREAM_REPORT_INTERVAL = std::chrono::seconds(5);

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
bundleminer v)" << VERSION << R"(
Майнинг proof-of-work с отправкой решений через bundle relay

ИСПОЛЬЗОВАНИЕ:
    bundle-miner [ОПЦИИ] <КОМАНДА>

КОМАНДЫ:
    bundle-mine          Фиксированные воркеры, CPU решатель
    bundle-mine-pooled   Пул пакетов, GPU решатель
    claim                Вывести награды на token аккаунт получателя
    init-claim           Создать token аккаунт владельца ключа --keypair
    tip-stream           Показывать перцентили принятых tip

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (bundleminer.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти
    --test-rpc           Проверить подключение к RPC и выйти
    --keypair PATH       Файл ключа для init-claim

ПРИМЕРЫ:
    bundle-miner -c /etc/bundleminer/bundleminer.toml bundle-mine
    bundle-miner --test-rpc
    bundle-miner --keypair ~/keys/owner.json init-claim

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "bundleminer v" << VERSION << std::endl;
    std::cout << "libcurl: " << curl_version() << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> command;
    std::optional<std::string> keypair_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool test_rpc = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--test-rpc") {
            args.test_rpc = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--keypair" && i + 1 < argc) {
            args.keypair_path = argv[++i];
        } else if (!arg.starts_with("-") && !args.command) {
            args.command = std::string(arg);
        }
    }

    return args;
}

/**
 * @brief RAII для curl_global_init / curl_global_cleanup
 */
class CurlGlobal {
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }

    // Запрещаем копирование
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * @brief Ждать сигнала завершения или окончания работы
 *
 * @param finished Проверка, что работа завершилась сама
 */
void wait_for_shutdown(std::stop_source& stop, const std::function<bool()>& finished = {}) {
    while (g_running.load(std::memory_order_relaxed)) {
        if (finished && finished()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    bundleminer::log::info("Остановка...");
    stop.request_stop();
}

/**
 * @brief Общие сервисы всех команд
 */
struct Services {
    bundleminer::Config config;
    bundleminer::ledger::ProgramAddresses addresses;
    bundleminer::ledger::TipRecipients recipients;
};

std::unique_ptr<bundleminer::tips::TipFeed> make_tip_feed(const bundleminer::Config& config) {
    using namespace bundleminer;
    auto feed = std::make_unique<tips::TipFeed>(
        std::make_unique<tips::WebSocketTipStream>(config.tip_feed.url),
        std::chrono::seconds{config.tip_feed.reconnect_seconds});
    feed->start();
    return feed;
}

// =============================================================================
// Команды
// =============================================================================

int run_test_rpc(const Services& services) {
    using namespace bundleminer;

    rpc::RpcLedger ledger(services.config.rpc, services.addresses);

    auto slot = ledger.get_slot();
    if (!slot) {
        log::error("Не удалось подключиться к RPC {}: {}", services.config.rpc.url, slot.error().message);
        return 1;
    }
    log::info("Подключено к RPC {} slot={}", services.config.rpc.url, *slot);

    auto snapshot = ledger.fetch_snapshot();
    if (!snapshot) {
        log::error("Не удалось получить состояние программы: {}", snapshot.error().message);
        return 1;
    }
    log::info("reward_rate={:.9f} last_reset_at={} time_to_epoch={}s buses={}",
              ledger::amount_to_ui(snapshot->treasury.reward_rate),
              snapshot->treasury.last_reset_at,
              ledger::time_to_next_epoch(snapshot->treasury, snapshot->clock).count(),
              snapshot->buses.size());
    return 0;
}

int run_bundle_mine(const Services& services) {
    using namespace bundleminer;
    const auto& config = services.config;

    auto identities = mining::load_identities(config.mining.key_folder, services.addresses);
    if (!identities) {
        log::error("{}", identities.error().message);
        return 1;
    }
    log::info("загружено ключей: {}", identities->size());

    rpc::RpcLedger ledger(config.rpc, services.addresses);
    relay::JitoRelay relay(config.relay);
    mining::ProcessSolver solver(
        mining::resolve_solver_path(config.mining.solver_path, constants::DEFAULT_SOLVER_BINARY),
        static_cast<uint8_t>(config.mining.threads));
    log::info("решатель {} threads={}", solver.executable().string(), config.mining.threads);

    auto tip_feed = make_tip_feed(config);
    monitoring::RewardReporter reporter(std::chrono::seconds{config.mining.reward_report_interval});
    reporter.start();

    mining::MiningContext context{ledger, relay, solver, *tip_feed, services.addresses,
                                  services.recipients, config.mining};
    mining::PermitSemaphore permits(static_cast<std::ptrdiff_t>(config.mining.concurrency));

    std::vector<std::unique_ptr<mining::FixedWorker>> workers;
    auto chunks = mining::split_into_chunks(std::move(*identities), config.mining.batch_size);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        workers.push_back(std::make_unique<mining::FixedWorker>(i, std::move(chunks[i]), context, permits));
    }

    std::stop_source stop;
    {
        std::vector<std::jthread> threads;
        for (auto& worker : workers) {
            threads.emplace_back([&worker, token = stop.get_token()] { worker->run(token); });
        }
        wait_for_shutdown(stop);
    }

    reporter.stop();
    reporter.report_once();
    tip_feed->stop();
    return 0;
}

int run_bundle_mine_pooled(const Services& services) {
    using namespace bundleminer;
    const auto& config = services.config;

    auto identities = mining::load_identities(config.mining.key_folder, services.addresses);
    if (!identities) {
        log::error("{}", identities.error().message);
        return 1;
    }
    log::info("загружено ключей: {}", identities->size());

    auto pool = mining::ResourcePool::create(std::move(*identities), config.mining.batch_size);
    if (!pool) {
        log::error("{}", pool.error().message);
        return 1;
    }
    log::info("ключи разбиты на пакеты batches={}", (*pool)->batch_count());

    rpc::RpcLedger ledger(config.rpc, services.addresses);
    relay::JitoRelay relay(config.relay);
    mining::ProcessSolver solver(
        mining::resolve_solver_path(config.mining.gpu_solver_path, constants::DEFAULT_GPU_SOLVER_BINARY),
        0);
    log::info("решатель {}", solver.executable().string());

    auto tip_feed = make_tip_feed(config);
    monitoring::RewardReporter reporter(std::chrono::seconds{config.mining.reward_report_interval});
    reporter.start();

    mining::MiningContext context{ledger, relay, solver, *tip_feed, services.addresses,
                                  services.recipients, config.mining};

    std::stop_source stop;
    {
        TaskGroup tasks(stop.get_token());
        mining::PooledScheduler scheduler(context, **pool, tasks);
        std::jthread thread([&scheduler, token = stop.get_token()] { scheduler.run(token); });
        wait_for_shutdown(stop);
        thread.join();
        tasks.stop();
    }

    reporter.stop();
    reporter.report_once();
    tip_feed->stop();
    return 0;
}

int run_claim(const Services& services) {
    using namespace bundleminer;
    const auto& config = services.config;

    auto identities = mining::load_identities(config.mining.key_folder, services.addresses);
    if (!identities) {
        log::error("{}", identities.error().message);
        return 1;
    }

    rpc::RpcLedger ledger(config.rpc, services.addresses);
    relay::JitoRelay relay(config.relay);
    mining::ClaimRunner runner(ledger, relay, services.addresses, services.recipients,
                               config.mining, config.claim);

    std::stop_source stop;
    std::atomic<bool> finished{false};
    Result<void> result;
    {
        std::jthread thread([&] {
            result = runner.run(stop.get_token(), *identities);
            finished.store(true, std::memory_order_release);
        });
        wait_for_shutdown(stop, [&finished] { return finished.load(std::memory_order_acquire); });
    }

    if (!result) {
        log::error("{}", result.error().message);
        return 1;
    }
    return 0;
}

int run_init_claim(const Services& services, const std::string& keypair_path) {
    using namespace bundleminer;
    const auto& config = services.config;

    auto owner = crypto::Keypair::load_file(keypair_path);
    if (!owner) {
        log::error("{}", owner.error().message);
        return 1;
    }

    rpc::RpcLedger ledger(config.rpc, services.addresses);
    relay::JitoRelay relay(config.relay);
    mining::ClaimRunner runner(ledger, relay, services.addresses, services.recipients,
                               config.mining, config.claim);

    std::stop_source stop;
    std::atomic<bool> finished{false};
    Result<ledger::Pubkey> result = Err<ledger::Pubkey>(ErrorCode::NetworkTimeout);
    {
        std::jthread thread([&] {
            result = runner.init_token_account(stop.get_token(), *owner);
            finished.store(true, std::memory_order_release);
        });
        wait_for_shutdown(stop, [&finished] { return finished.load(std::memory_order_acquire); });
    }

    if (!result) {
        log::error("{}", result.error().message);
        return 1;
    }
    log::info("beneficiary для claim: {}", owner->pubkey().to_base58());
    return 0;
}

int run_tip_stream(const Services& services) {
    using namespace bundleminer;

    auto tip_feed = make_tip_feed(services.config);
    log::info("подписка на {}", services.config.tip_feed.url);

    auto next_report = std::chrono::steady_clock::now() + TIP_STREAM_REPORT_INTERVAL;
    std::stop_source stop;
    wait_for_shutdown(stop, [&] {
        if (std::chrono::steady_clock::now() >= next_report) {
            const auto tips = tip_feed->snapshot();
            log::info("tips p25={} p50={} p75={} p95={} p99={} connections={}",
                      tips.p25, tips.p50, tips.p75, tips.p95, tips.p99,
                      tip_feed->connection_attempts());
            next_report += TIP_STREAM_REPORT_INTERVAL;
        }
        return false;
    });

    tip_feed->stop();
    return 0;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace bundleminer;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    auto config_result = Config::load_with_search(args.config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    auto& logger = log::Logger::instance();
    if (auto level = log::parse_level(config.logging.level)) {
        logger.set_level(*level);
    }
    logger.set_color(config.logging.color);

    log::info("конфигурация загружена");

    if (args.test_config) {
        log::info("конфигурация валидна");
        return 0;
    }

    auto addresses = ledger::ProgramAddresses::derive(config.program.program_id,
                                                      config.program.mint_address);
    if (!addresses) {
        log::error("Некорректные адреса программы: {}", addresses.error().message);
        return 1;
    }
    auto recipients = ledger::TipRecipients::load();
    if (!recipients) {
        log::error("Некорректные получатели tip: {}", recipients.error().message);
        return 1;
    }

    CurlGlobal curl;
    Services services{config, *addresses, *recipients};

    if (args.test_rpc) {
        return run_test_rpc(services);
    }

    if (!args.command) {
        print_help();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    const std::string& command = *args.command;

    if (command == "bundle-mine" || command == "bundle-mine-pooled") {
        auto ready = config.validate_for_mining();
        if (!ready) {
            log::error("{}", ready.error().message);
            return 1;
        }
        return command == "bundle-mine" ? run_bundle_mine(services) : run_bundle_mine_pooled(services);
    }

    if (command == "claim") {
        auto ready = config.validate_for_claim();
        if (!ready) {
            log::error("{}", ready.error().message);
            return 1;
        }
        return run_claim(services);
    }

    if (command == "init-claim") {
        if (!args.keypair_path) {
            log::error("Для init-claim нужен --keypair");
            return 1;
        }
        return run_init_claim(services, *args.keypair_path);
    }

    if (command == "tip-stream") {
        return run_tip_stream(services);
    }

    log::error("Неизвестная команда: {}", command);
    print_help();
    return 1;
}
