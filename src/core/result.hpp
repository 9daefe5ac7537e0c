#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace quire {

/**
 * ErrorKind - How a caller should react to a failure.
 *
 * Transient failures (I/O, timeouts, a busy database) may be retried.
 * Structural failures need a different input or a human decision.
 * Fatal failures mean persisted data may be corrupted.
 */
enum class ErrorKind {
    Transient,
    Structural,
    Fatal
};

enum class ErrorCode {
    Storage,
    NotFound,
    AlreadyExists,
    InvalidState,
    CapacityExceeded,
    Timeout,
    Cancelled,
    OperationFailed,
    ConflictUnresolved,
    ChecksumMismatch,
    Io,
    Parse,
    BackupInProgress,
    NoBackupAvailable,
    Unrecoverable
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Storage: return "storage";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::AlreadyExists: return "already-exists";
        case ErrorCode::InvalidState: return "invalid-state";
        case ErrorCode::CapacityExceeded: return "capacity-exceeded";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::OperationFailed: return "operation-failed";
        case ErrorCode::ConflictUnresolved: return "conflict-unresolved";
        case ErrorCode::ChecksumMismatch: return "checksum-mismatch";
        case ErrorCode::Io: return "io";
        case ErrorCode::Parse: return "parse";
        case ErrorCode::BackupInProgress: return "backup-in-progress";
        case ErrorCode::NoBackupAvailable: return "no-backup-available";
        case ErrorCode::Unrecoverable: return "unrecoverable";
    }
    return "unknown";
}

/**
 * Error type for Result.
 *
 * `detail` carries the underlying library code where there is one
 * (the SQLite result code for ErrorCode::Storage).
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::OperationFailed};
    ErrorKind kind{ErrorKind::Structural};
    int detail{0};

    Error() = default;
    explicit Error(std::string msg,
                   ErrorCode c = ErrorCode::OperationFailed,
                   ErrorKind k = ErrorKind::Structural)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error transient(std::string msg, ErrorCode c) {
        return Error{std::move(msg), c, ErrorKind::Transient};
    }

    [[nodiscard]] static Error structural(std::string msg, ErrorCode c) {
        return Error{std::move(msg), c, ErrorKind::Structural};
    }

    [[nodiscard]] static Error fatal(std::string msg, ErrorCode c = ErrorCode::Unrecoverable) {
        return Error{std::move(msg), c, ErrorKind::Fatal};
    }

    /**
     * Wrap a SQLite failure. Busy/locked databases are retryable.
     */
    [[nodiscard]] static Error storage(std::string msg, int sqlite_rc) {
        // SQLITE_BUSY = 5, SQLITE_LOCKED = 6, SQLITE_IOERR = 10
        const bool retryable = sqlite_rc == 5 || sqlite_rc == 6 || (sqlite_rc & 0xff) == 10;
        Error e{std::move(msg), ErrorCode::Storage,
                retryable ? ErrorKind::Transient : ErrorKind::Structural};
        e.detail = sqlite_rc;
        return e;
    }

    /**
     * Prefix the message with context, keeping code and kind.
     */
    [[nodiscard]] Error with_context(const std::string& context) const {
        Error e = *this;
        e.message = context + ": " + message;
        return e;
    }

    [[nodiscard]] bool is_fatal() const noexcept { return kind == ErrorKind::Fatal; }
    [[nodiscard]] bool is_transient() const noexcept { return kind == ErrorKind::Transient; }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a success value or an error.
 *
 * Usage:
 *   Res<Entity> load(const Uuid& id) {
 *       auto row = repo.get_entity(id);
 *       if (row.is_err()) return Res<Entity>::err(row.unwrap_err());
 *       ...
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    /**
     * Run a side effect on the error (typically logging) and pass the Result through.
     */
    template<typename F>
    Result& inspect_err(F&& f) & {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    Result& inspect_err(F&& f) & {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

} // namespace quire
