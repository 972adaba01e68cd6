#pragma once
#include <string>
#include <utility>
#include <variant>

namespace tether {
namespace utils {

// Generic Result<T> template
// Holds either a value of type T or an error message

template <typename T>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructor
    Result(const std::string& error) : data_(Error{error}) {}
    Result(std::string&& error) : data_(Error{std::move(error)}) {}
    Result(const char* error) : data_(Error{error}) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const std::string& error() const { return std::get<Error>(data_).message; }

private:
    struct Error {
        std::string message;
    };
    std::variant<T, Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    // Success constructor
    Result() : success_(true) {}
    // Error constructor
    Result(const std::string& error) : success_(false), error_(error) {}
    Result(std::string&& error) : success_(false), error_(std::move(error)) {}
    Result(const char* error) : success_(false), error_(error) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const std::string& error() const { return error_; }

private:
    bool success_ = false;
    std::string error_;
};

} // namespace utils
} // namespace tether

// For convenience, provide a top-level alias
namespace tether {
using utils::Result;
}
