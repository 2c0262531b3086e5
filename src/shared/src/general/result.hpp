#pragma once
#include "general/errors.hpp"
#include <optional>
#include <tl/expected.hpp>
template <typename T>
struct Result : public tl::expected<T, Error> {
    Result(tl::expected<T, Error> t)
        : tl::expected<T, Error>(std::move(t))
    {
    }
    Result(std::optional<T> t)
        : Result(
              [&]() -> Result {
                  if (t) {
                      return Result(std::move(*t));
                  } else {
                      return Result(Error(ENOTFOUND));
                  }
              }())
    {
    }
    Result(T t)
        : tl::expected<T, Error>(std::move(t))
    {
    }
    Result(Error e)
        : tl::expected<T, Error>(tl::make_unexpected(e))
    {
    }
    // throws the contained error
    T value_throw() &&
    {
        if (!this->has_value())
            throw this->error();
        return std::move(**this);
    }
};

template <>
struct Result<void> : public tl::expected<void, Error> {
    Result(tl::expected<void, Error> t)
        : tl::expected<void, Error>(std::move(t))
    {
    }
    Result() // for Result<void> default constructor
        : tl::expected<void, Error>({})
    {
    }
    Result(Error e)
        : tl::expected<void, Error>(tl::make_unexpected(e))
    {
    }
    void value_throw() const
    {
        if (!has_value())
            throw error();
    }
};
