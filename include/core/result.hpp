#pragma once
#include <string>
#include <variant>
#include <utility>
#include <stdexcept>

namespace core {

enum class ErrorKind { Indicator, Signal, Data, Config };

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Indicator: return "IndicatorError";
        case ErrorKind::Signal:    return "SignalError";
        case ErrorKind::Data:      return "DataError";
        default:                   return "ConfigError";
    }
}

struct Error {
    ErrorKind kind{ErrorKind::Data};
    std::string message;

    std::string describe() const { return std::string(to_string(kind)) + ": " + message; }
};

inline Error indicator_error(std::string msg) { return {ErrorKind::Indicator, std::move(msg)}; }
inline Error data_error(std::string msg)      { return {ErrorKind::Data, std::move(msg)}; }
inline Error config_error(std::string msg)    { return {ErrorKind::Config, std::move(msg)}; }

// Value or error. Callers check ok() before touching value();
// value() on an error result throws std::logic_error.
template <class T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(v_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { check(); return std::get<T>(v_); }
    T& value() & { check(); return std::get<T>(v_); }
    T&& value() && { check(); return std::get<T>(std::move(v_)); }

    const Error& error() const { return std::get<Error>(v_); }

private:
    void check() const {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().describe());
    }

    std::variant<T, Error> v_;
};

} // namespace core
