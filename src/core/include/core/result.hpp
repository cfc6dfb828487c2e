#pragma once

#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace nla::core {

/**
 * Result type for operations that can fail.
 * Holds either a value or a human readable error message.
 */
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}

    static Result failure(std::string message) {
        return Result(std::in_place_index<1>, std::move(message));
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // Access value (only call if is_ok())
    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }

    // Moves the value out; for move-only payloads such as decoder handles.
    T take() { return std::move(std::get<0>(data_)); }

    // Access error message (only call if is_error())
    const std::string& error() const { return std::get<1>(data_); }

    std::optional<T> try_value() const {
        if (is_ok()) {
            return value();
        }
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& func) const -> Result<decltype(func(std::declval<const T&>()))> {
        using ReturnType = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<ReturnType>(func(value()));
        }
        return Result<ReturnType>::failure(error());
    }

private:
    Result(std::in_place_index_t<1>, std::string message) : data_(std::in_place_index<1>, std::move(message)) {}
    std::variant<T, std::string> data_;
};

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Error(std::string message) {
    return Result<T>::failure(std::move(message));
}

// Void result type for operations that don't return values
using VoidResult = Result<bool>;

inline VoidResult Ok() {
    return VoidResult(true);
}

} // namespace nla::core
