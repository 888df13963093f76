#pragma once

#include <optional>
#include <string>
#include <variant>

namespace tiersync {

/**
 * @brief Failure categories surfaced by the sync engine
 *
 * Io     - local filesystem stat/read failure
 * Remote - network or API failure reported by the remote store
 * Race   - create notification raced with an object already in the store
 * Config - invalid configuration, detected before watching starts
 */
enum class ErrorKind {
    Io,
    Remote,
    Race,
    Config
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Remote: return "remote";
        case ErrorKind::Race: return "race";
        case ErrorKind::Config: return "config";
        default: return "unknown";
    }
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline Error io_error(std::string message) { return Error(ErrorKind::Io, std::move(message)); }
inline Error remote_error(std::string message) { return Error(ErrorKind::Remote, std::move(message)); }
inline Error race_error(std::string message) { return Error(ErrorKind::Race, std::move(message)); }
inline Error config_error(std::string message) { return Error(ErrorKind::Config, std::move(message)); }

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

} // namespace tiersync
