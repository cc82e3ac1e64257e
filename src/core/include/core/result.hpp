#pragma once

#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace tlc::core {

/**
 * Value-or-message result for I/O facing operations (job loading, probing).
 * Compiler stages use tlc::expected with a typed BuildError instead.
 */
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(std::string error) : data_(std::move(error)) {}
    
    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<std::string>(data_); }
    explicit operator bool() const { return is_ok(); }
    
    // Access value (only call if is_ok())
    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    
    // Access error message (only call if is_error())
    const std::string& error() const { return std::get<std::string>(data_); }
    
private:
    std::variant<T, std::string> data_;
};

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Error(std::string message) {
    return Result<T>(std::move(message));
}

// Operations that only report success or a message
using VoidResult = Result<bool>;

inline VoidResult Ok() {
    return VoidResult(true);
}

} // namespace tlc::core
