#pragma once
#include "general/errors.hpp"
#include "tools/expected.hpp"
#include <optional>
template <typename T>
struct Result : public vbt::expected<T, Error> {
    Result(vbt::expected<T, Error> t)
        : vbt::expected<T, Error>(std::move(t))
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
        : vbt::expected<T, Error>(std::move(t))
    {
    }
    Result(Error e)
        : vbt::expected<T, Error>(tl::make_unexpected(e))
    {
    }
};

template <>
struct Result<void> : public vbt::expected<void, Error> {
    Result(vbt::expected<void, Error> t)
        : vbt::expected<void, Error>(std::move(t))
    {
    }
    Result() // for Result<void> default constructor
        : vbt::expected<void, Error>({})
    {
    }
    Result(Error e)
        : vbt::expected<void, Error>(tl::make_unexpected(e))
    {
    }
};
