#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace webpilot::core {

enum class ErrorKind {
    // User-correctable: unknown names, unsupported flag combinations, missing tools.
    Configuration,
    // The toolchain already printed the details.
    Build,
};

struct Error {
    ErrorKind kind = ErrorKind::Configuration;
    std::string message;

    static Error configuration(std::string message) {
        return Error{ErrorKind::Configuration, std::move(message)};
    }

    static Error build() {
        return Error{ErrorKind::Build, {}};
    }
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }

    static Result error(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return isOk(); }

    const T &value() const & {
        if (!isOk()) {
            throw std::logic_error("Result::value() called on an error: " + error().message);
        }
        return std::get<T>(data_);
    }

    T &&value() && {
        if (!isOk()) {
            throw std::logic_error("Result::value() called on an error: " + error().message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error &error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}

    std::variant<T, Error> data_;
};

} // namespace webpilot::core
