#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace docsync {

/**
 * ErrorKind - coarse classification carried by every Error.
 *
 * The retry policy keys off this value, so producers (store, remote,
 * blob store) must pick the kind that matches the failure, not the
 * layer that observed it.
 */
enum class ErrorKind {
    Internal,
    Validation,
    Concurrency,
    Network,
    Timeout,
    Auth,
    NotFound,
    Storage,
    Quota
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Internal: return "internal";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Concurrency: return "concurrency";
        case ErrorKind::Network: return "network";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Quota: return "quota";
    }
    return "internal";
}

/**
 * Error - a failure with a message, a kind and an optional numeric code
 * (SQLite result code, HTTP-ish status from a remote, ...).
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Internal};

    Error() = default;
    explicit Error(std::string msg, int c = 0, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), code(c), kind(k) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error validation(std::string msg) {
        return Error(ErrorKind::Validation, std::move(msg));
    }
    [[nodiscard]] static Error not_found(std::string msg) {
        return Error(ErrorKind::NotFound, std::move(msg));
    }
    [[nodiscard]] static Error storage(std::string msg, int c = 0) {
        return Error(ErrorKind::Storage, std::move(msg), c);
    }

    bool operator==(const Error& other) const = default;
};

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 *   auto doc = repo.get_by_sync_id(id)
 *       .and_then([&](auto found) { return validate(found); });
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

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Access the value; throws std::logic_error on an error result.
     * Tests and already-checked paths only.
     */
    [[nodiscard]] T& unwrap() & {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::logic_error("Result::unwrap_err() on ok result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) {
            throw std::logic_error("Result::unwrap_err() on ok result");
        }
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            if constexpr (std::is_void_v<U>) {
                std::invoke(std::forward<F>(f), std::get<0>(data_));
                return Result<void, E>::ok();
            } else {
                return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
            }
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return R::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using R = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return R::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void check_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::logic_error("Result::unwrap() on error: " + std::get<1>(data_).message);
        } else {
            throw std::logic_error("Result::unwrap() on error");
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

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (ok_) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::logic_error("Result::unwrap() on error: " + error_.message);
        } else {
            throw std::logic_error("Result::unwrap() on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const {
        if (ok_) {
            throw std::logic_error("Result::unwrap_err() on ok result");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        if (ok_) {
            return std::invoke(std::forward<F>(f));
        }
        return R::err(error_);
    }

private:
    Result() : ok_(true) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

/**
 * Forward the error of `from` into a Result of another value type.
 */
template<typename T, typename U>
[[nodiscard]] Result<T, Error> propagate(const Result<U, Error>& from) {
    return Result<T, Error>::err(from.unwrap_err());
}

} // namespace docsync
