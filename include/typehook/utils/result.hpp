#pragma once
#include <string>
#include <utility>
#include <variant>

namespace typehook {
namespace utils {

enum class ErrorCode {
    InvalidArgument,
    IoError,
    ParseError
};

struct Error {
    ErrorCode code;
    std::string message;
};

// Holds either a value of type T or an Error describing why it is missing

template <typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

} // namespace utils
} // namespace typehook

namespace typehook {
using utils::Error;
using utils::ErrorCode;
using utils::Result;
}
