#pragma once
#include "SQLiteCpp/Statement.h"
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace sqlite {

class Statement;
class Row {

private: // data
    std::reference_wrapper<Statement> st;

protected:
    bool hasValue;

public:
    friend class Statement;
    template <typename T>
    T get(int index) const;
    template <typename T>
    std::optional<T> get_optional(int index) const;
    template <size_t N>
    std::array<uint8_t, N> get_array(int index) const;
    std::vector<uint8_t> get_vector(int index) const;
    bool has_value() const { return hasValue; }
    auto process(auto lambda) const;

protected:
    void value_assert() const;
    Row(Statement& st);
    Statement& statement() const;
};

class Statement : public SQLite::Statement {
public:
    using SQLite::Statement::Statement;
    template <typename T>
    void bind(const int index, const T&);
    template <typename T>
    void bind(const int index, const std::optional<T>&);
    template <size_t i>
    void recursive_bind();
    template <size_t i, typename T, typename... Types>
    void recursive_bind(T&& t, Types&&... types);
    template <typename... Types>
    auto& bind_multiple(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return *this;
    }
    template <typename... Types>
    uint32_t run(Types&&... types);
    Row next_row() { return *this; }

    struct SingleResult : public Row {
        SingleResult(Statement& s)
            : Row(s)
        {
        }
        SingleResult(const SingleResult&) = delete;
        ~SingleResult()
        {
            statement().reset();
        }
    };

    template <typename... Types>
    [[nodiscard]] SingleResult one(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return SingleResult { *this };
    }

    template <typename Lambda, typename... Types>
    void for_each(Lambda lambda, Types&&... types);

    template <typename Lambda, typename... Types>
    [[nodiscard]] auto all(Lambda lambda, Types&&... types)
    {
        using ret_t = std::remove_cvref_t<decltype(lambda(next_row()))>;
        std::vector<ret_t> res;
        for_each([&](const Row& row) {
            res.push_back(lambda(row));
        },
            std::forward<Types>(types)...);
        return res;
    }
};

}
