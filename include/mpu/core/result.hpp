#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mpu {

// Wrapper types so a Result can be built from Ok(...)/Err(...) without
// naming both template arguments, and so T == E stays unambiguous.
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<>
struct OkValue<void> {};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    // Lets an error of a compatible type propagate without rewrapping.
    template<typename U, typename = std::enable_if_t<!std::is_same_v<U, E> && std::is_constructible_v<E, U>>>
    Result(ErrValue<U> err) : data_(std::in_place_index<1>, E(std::move(err.error))) {}

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
    Result(OkValue<void>) : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    template<typename U, typename = std::enable_if_t<!std::is_same_v<U, E> && std::is_constructible_v<E, U>>>
    Result(ErrValue<U> err) : error_(E(std::move(err.error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<T> Ok(T value) { return OkValue<T>(std::move(value)); }

inline OkValue<void> Ok() { return OkValue<void>{}; }

template<typename E>
ErrValue<E> Err(E error) { return ErrValue<E>(std::move(error)); }

} // namespace mpu
