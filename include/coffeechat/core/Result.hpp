#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "coffeechat/core/Error.hpp"

namespace coffeechat {
namespace core {

template <typename T>
class Result
{
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(Error error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isOk() const { return m_data.index() == 0; }
    explicit operator bool() const { return isOk(); }

    const T &value() const { return std::get<0>(m_data); }
    T &value() { return std::get<0>(m_data); }
    T takeValue() { return std::move(std::get<0>(m_data)); }
    const Error &error() const { return std::get<1>(m_data); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U &&payload)
        : m_data(tag, std::forward<U>(payload))
    {
    }

    std::variant<T, Error> m_data;
};

template <>
class Result<void>
{
public:
    static Result success() { return Result(std::nullopt); }
    static Result failure(Error error) { return Result(std::move(error)); }

    bool isOk() const { return !m_error.has_value(); }
    explicit operator bool() const { return isOk(); }
    const Error &error() const { return *m_error; }

private:
    explicit Result(std::optional<Error> error)
        : m_error(std::move(error))
    {
    }

    std::optional<Error> m_error;
};

} // namespace core
} // namespace coffeechat
