#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace dcp {

// Wrappers keep construction unambiguous when T == E
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

/**
 * @brief Value-or-error return type used across storage and copy code
 *
 * The error type defaults to a message string; the copy engine uses a
 * classified error instead (see dcp/copy/errors.hpp).
 */
template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    using value_type = T;
    using error_type = E;

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

    /// Moves the value out; only valid when is_ok()
    T take_value() { return std::move(std::get<0>(data_)); }

    /// Rewraps the error through @p fn, moving the value through untouched
    template<typename F>
    auto map_error(F&& fn) && -> Result<T, std::decay_t<decltype(fn(std::declval<const E&>()))>> {
        using Mapped = std::decay_t<decltype(fn(std::declval<const E&>()))>;
        if (is_ok()) {
            return Result<T, Mapped>(OkValue<T>(take_value()));
        }
        return Result<T, Mapped>(ErrValue<Mapped>(fn(error())));
    }
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

    template<typename F>
    auto map_error(F&& fn) const -> Result<void, std::decay_t<decltype(fn(std::declval<const E&>()))>> {
        using Mapped = std::decay_t<decltype(fn(std::declval<const E&>()))>;
        if (is_ok()) {
            return Result<void, Mapped>();
        }
        return Result<void, Mapped>(ErrValue<Mapped>(fn(error())));
    }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = std::string>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

} // namespace dcp
