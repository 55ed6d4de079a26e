#pragma once
#include <variant>
namespace vbt { // veilbatch tools namespace
template <typename... Ts>
struct variant : public std::variant<Ts...> {
    using std::variant<Ts...>::variant;
    template <typename... Rs>
    struct Overload : Rs... {
        using Rs::operator()...;
    };
    template <typename... Rs>
    Overload(Rs...) -> Overload<Rs...>;

    template <typename... U>
    auto visit_overload(U&&... u) const&
    {
        return visit(Overload { std::forward<U>(u)... });
    }
    auto visit(auto lambda) const&
    {
        return std::visit(lambda, static_cast<const std::variant<Ts...>&>(*this));
    }
    template <typename T>
    [[nodiscard]] bool holds() const { return std::holds_alternative<T>(*this); }
    template <typename T>
    auto& get() const { return std::get<T>(*this); }
    template <typename T>
    auto* get_if() const { return std::get_if<T>(static_cast<const std::variant<Ts...>*>(this)); }
};

}
