#pragma once
#include "SQLiteCpp/SQLiteCpp.h"
#include "spdlog/spdlog.h"
#include "sqlite_fwd.hpp"
#include "type_conv.hpp"

namespace sqlite {

inline Statement& Row::statement() const
{
    return st.get();
}

template <typename T>
inline T Row::get(int index) const
{
    value_assert();
    return ColumnConverter(statement().getColumn(index));
}

template <typename T>
inline std::optional<T> Row::get_optional(int index) const
{
    value_assert();
    ColumnConverter c(statement().getColumn(index));
    if (c.is_null())
        return {};
    return static_cast<T>(c);
}

template <size_t N>
inline std::array<uint8_t, N> Row::get_array(int index) const
{
    value_assert();
    return ColumnConverter(statement().getColumn(index)).get_array<N>();
}

inline std::vector<uint8_t> Row::get_vector(int index) const
{
    value_assert();
    return ColumnConverter(statement().getColumn(index)).get_vector();
}

inline auto Row::process(auto lambda) const
{
    using ret_t = std::remove_cvref_t<decltype(lambda(*this))>;
    std::optional<ret_t> r;
    if (has_value())
        r = lambda(*this);
    return r;
}

inline void Row::value_assert() const
{
    if (!hasValue) {
        throw std::runtime_error(
            "Database error: trying to access empty result.");
    }
}
inline Row::Row(Statement& st)
    : st(st)
{
    hasValue = statement().executeStep();
}

template <typename T>
inline void Statement::bind(const int index, const T& t)
{
    struct Binder {
        using Stmt = SQLite::Statement;
        Binder(Stmt& stmt)
            : stmt(stmt)
        {
        }
        void bind_param(int i, int64_t a)
        {
            stmt.bind(i, a);
        }
        void bind_param(const int i, std::span<const uint8_t> s)
        {
            stmt.bind(i, s.data(), int(s.size()));
        }
        void bind_param(const int i, const std::string& s)
        {
            stmt.bind(i, s);
        }
        auto bind(int i, const auto& a)
        {
            bind_param(i, bind_convert::convert(a));
        }
        Stmt& stmt;
    };
    Binder(*this).bind(index, t);
}

template <typename T>
inline void Statement::bind(const int index, const std::optional<T>& o)
{
    if (o)
        bind(index, *o);
    else
        SQLite::Statement::bind(index);
}

template <size_t i>
void Statement::recursive_bind()
{
}
template <size_t i, typename T, typename... Types>
void Statement::recursive_bind(T&& t, Types&&... types)
{
    bind(i, std::forward<T>(t));
    recursive_bind<i + 1>(std::forward<Types>(types)...);
}
template <typename... Types>
inline uint32_t Statement::run(Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    auto nchanged = exec();
    reset();
    if (nchanged < 0)
        throw std::runtime_error("Database error: negative change count.");
    return nchanged;
}

template <typename Lambda, typename... Types>
void Statement::for_each(Lambda lambda, Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    while (true) {
        auto r { next_row() };
        if (!r.has_value())
            break;
        lambda(r);
    }
    reset();
}

}
