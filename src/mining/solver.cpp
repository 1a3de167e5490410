/**
 * @file solver.cpp
 * @brief Реализация внешнего решателя
 */

#include "solver.hpp"
#include "../core/byte_order.hpp"
#include "../log/logger.hpp"

#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bundleminer::mining {

namespace {

/// @brief Таймаут poll() между проверками остановки (мс)
constexpr int POLL_TIMEOUT_MS = 200;

/**
 * @brief Владелец файлового дескриптора
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    // Запрещаем копирование
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Err<Pipe>(
            ErrorCode::SystemIOError,
            std::format("Не удалось создать pipe: {}", strerror(errno))
        );
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/**
 * @brief Дождаться завершения процесса
 *
 * @return Код выхода или -1, если процесс завершён сигналом
 */
int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

// =============================================================================
// Протокол
// =============================================================================

Bytes encode_solver_input(
    uint8_t threads,
    const Hash256& difficulty,
    std::span<const SolveRequest> requests
) {
    Bytes input;
    input.reserve(1 + difficulty.size() + requests.size() * 64);
    input.push_back(threads);
    append_bytes(input, difficulty);
    for (const auto& request : requests) {
        append_bytes(input, request.challenge);
        append_bytes(input, request.authority.bytes);
    }
    return input;
}

Result<std::vector<SolveResult>> decode_solver_output(ByteSpan output, std::size_t expected) {
    if (output.size() != expected * SOLVE_RECORD_SIZE) {
        return Err<std::vector<SolveResult>>(
            ErrorCode::MiningSolverFailed,
            std::format("Решатель вернул {} байт, ожидалось {} записей по {} байт",
                        output.size(), expected, SOLVE_RECORD_SIZE)
        );
    }

    std::vector<SolveResult> results;
    results.reserve(expected);
    for (std::size_t offset = 0; offset < output.size(); offset += SOLVE_RECORD_SIZE) {
        SolveResult result;
        std::memcpy(result.hash.data(), output.data() + offset, result.hash.size());
        result.nonce = read_le64(output.data() + offset + 32);
        results.push_back(result);
    }
    return results;
}

// =============================================================================
// ProcessSolver
// =============================================================================

ProcessSolver::ProcessSolver(std::filesystem::path executable, uint8_t threads)
    : executable_(std::move(executable))
    , threads_(threads) {}

Result<std::vector<SolveResult>> ProcessSolver::solve(
    std::stop_token stop,
    const Hash256& difficulty,
    std::span<const SolveRequest> requests
) {
    if (requests.empty()) {
        return std::vector<SolveResult>{};
    }

    auto to_child = make_pipe();
    if (!to_child) {
        return std::unexpected(to_child.error());
    }
    auto from_child = make_pipe();
    if (!from_child) {
        return std::unexpected(from_child.error());
    }

    const std::string path = executable_.string();
    const pid_t pid = ::fork();
    if (pid < 0) {
        return Err<std::vector<SolveResult>>(
            ErrorCode::SystemProcessFailed,
            std::format("fork() не удался: {}", strerror(errno))
        );
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы
        ::dup2(to_child->read.get(), STDIN_FILENO);
        ::dup2(from_child->write.get(), STDOUT_FILENO);
        ::execl(path.c_str(), path.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    to_child->read.reset();
    from_child->write.reset();

    FileDescriptor input_fd = std::move(to_child->write);
    FileDescriptor output_fd = std::move(from_child->read);
    set_nonblocking(input_fd.get());
    set_nonblocking(output_fd.get());

    const Bytes input = encode_solver_input(threads_, difficulty, requests);
    std::size_t written = 0;
    Bytes output;
    output.reserve(requests.size() * SOLVE_RECORD_SIZE);

    auto fail = [pid](ErrorCode code, std::string message) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        return Err<std::vector<SolveResult>>(code, std::move(message));
    };

    uint8_t buffer[4096];

    while (output_fd.valid()) {
        if (stop.stop_requested()) {
            return fail(ErrorCode::MiningSolverFailed, "Решение прервано остановкой");
        }

        pollfd fds[2]{};
        nfds_t count = 0;
        fds[count].fd = output_fd.get();
        fds[count].events = POLLIN;
        ++count;
        if (input_fd.valid()) {
            fds[count].fd = input_fd.get();
            fds[count].events = POLLOUT;
            ++count;
        }

        const int ready = ::poll(fds, count, POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return fail(ErrorCode::SystemIOError,
                        std::format("Ошибка poll: {}", strerror(errno)));
        }
        if (ready == 0) {
            continue;
        }

        if (count > 1 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t n = ::write(input_fd.get(), input.data() + written, input.size() - written);
            if (n < 0 && errno == EPIPE) {
                // Решатель закрыл stdin, результат определит код выхода
                input_fd.reset();
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EINTR) {
                return fail(ErrorCode::SystemIOError,
                            std::format("Ошибка записи в решатель: {}", strerror(errno)));
            }
            if (n > 0) {
                written += static_cast<std::size_t>(n);
            }
            if (written == input.size()) {
                // EOF на stdin завершает решатель после последней задачи
                input_fd.reset();
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t n = ::read(output_fd.get(), buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                return fail(ErrorCode::SystemIOError,
                            std::format("Ошибка чтения из решателя: {}", strerror(errno)));
            }
            if (n == 0) {
                output_fd.reset();
            } else {
                output.insert(output.end(), buffer, buffer + n);
            }
        }
    }

    input_fd.reset();
    const int exit_code = wait_child(pid);
    if (exit_code != 0) {
        return Err<std::vector<SolveResult>>(
            ErrorCode::SystemProcessFailed,
            std::format("Решатель {} завершился с кодом {}", path, exit_code)
        );
    }

    return decode_solver_output(output, requests.size());
}

std::filesystem::path resolve_solver_path(std::string_view configured, std::string_view binary_name) {
    if (!configured.empty()) {
        return std::filesystem::path(configured);
    }

    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        log::warn("Не удалось определить путь к исполняемому файлу: {}", ec.message());
        return std::filesystem::path(binary_name);
    }
    return exe.parent_path() / binary_name;
}

} // namespace bundleminer::mining
