#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace konnect {

/**
 * ErrorCode - failure taxonomy shared by every layer.
 *
 * Codec, Handshake, TrustViolation, PairingTimeout, PairingRejected and Send
 * are protocol errors; the rest are local (storage, crypto, configuration).
 */
enum class ErrorCode {
    None = 0,
    Codec,
    Handshake,
    TrustViolation,
    PairingTimeout,
    PairingRejected,
    Send,
    Storage,
    Crypto,
    Config,
    Network,
    InvalidArgument,
    InvalidState,
};

[[nodiscard]] constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Codec: return "codec";
        case ErrorCode::Handshake: return "handshake";
        case ErrorCode::TrustViolation: return "trust-violation";
        case ErrorCode::PairingTimeout: return "pairing-timeout";
        case ErrorCode::PairingRejected: return "pairing-rejected";
        case ErrorCode::Send: return "send";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::Crypto: return "crypto";
        case ErrorCode::Config: return "config";
        case ErrorCode::Network: return "network";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::InvalidState: return "invalid-state";
    }
    return "unknown";
}

/**
 * Error type for Result - a message, a taxonomy code and an optional
 * native code (sqlite, OpenSSL, socket error).
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::None};
    int native{0};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::None, int n = 0)
        : message(std::move(msg)), code(c), native(n) {}

    [[nodiscard]] std::string describe() const {
        return std::string(error_code_name(code)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - either a value (Ok) or an error (Err).
 *
 *   Result<Packet> decode_packet(const QByteArray& line);
 *   auto packet = decode_packet(line);
 *   if (packet.is_err()) { ... packet.unwrap_err().code ... }
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
     * Access the value, throwing std::logic_error on an error result.
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

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::logic_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::logic_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void check_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::logic_error("Result::unwrap() called on error: " +
                                   std::get<1>(data_).describe());
        } else {
            throw std::logic_error("Result::unwrap() called on error");
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
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
            throw std::logic_error("Result::unwrap() called on error: " + error_.describe());
        } else {
            throw std::logic_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) throw std::logic_error("Result::unwrap_err() called on success");
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (ok_) return std::invoke(std::forward<F>(f));
        return ResultU::err(error_);
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
 * Shorthand for building an error result with a taxonomy code.
 */
template<typename T = void>
[[nodiscard]] Result<T, Error> fail(ErrorCode code, std::string message, int native = 0) {
    return Result<T, Error>::err(Error{std::move(message), code, native});
}

} // namespace konnect
