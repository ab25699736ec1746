#ifndef airnet_checked_hpp
#define airnet_checked_hpp

#include <ostream>
#include <type_traits>
#include <utility> // for std::exchange, std::forward

namespace airnet::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Value of type @c T that has been passed through a @c Checker.
/// @note The checker is invoked on every construction from a raw value and
///   is expected to throw if the value is invalid.
template <class T, functor_returns<T, T> Checker>
struct checked
{
    using value_type = T;
    using checker_type = Checker;

    checked() // NOLINT(bugprone-exception-escape)
    noexcept(noexcept(Checker{}()) && std::is_nothrow_move_constructible_v<T>):
        data{Checker{}()}
    {
        // Intentionally empty.
    }

    checked(const checked& other) = default;

    checked(checked&& other) // NOLINT(bugprone-exception-escape)
    noexcept(std::is_nothrow_move_constructible_v<value_type> &&
             noexcept(Checker{}())):
        data{std::exchange(other.data, checker_type{}())}
    {
        // Intentionally empty.
    }

    template <class U, class V = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, checked> &&
        functor_returns<Checker, T, U>
    >>
    checked(U&& u): data{checker_type{}(std::forward<U>(u))}
    {
        // Intentionally empty.
    }

    auto operator=(const checked& other) -> checked& = default;

    auto operator=(checked&& other) // NOLINT(bugprone-exception-escape)
        noexcept(std::is_nothrow_move_assignable_v<value_type>)
        -> checked&
    {
        if (this != &other) {
            data = std::exchange(other.data, checker_type{}());
        }
        return *this;
    }

    constexpr explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

private:
    value_type data;
};

template <class V, class C>
inline auto operator==(const checked<V, C>& lhs, const checked<V, C>& rhs)
    -> bool
{
    return lhs.get() == rhs.get();
}

template <class V, class C>
inline auto operator<(const checked<V, C>& lhs, const checked<V, C>& rhs)
    -> bool
{
    return lhs.get() < rhs.get();
}

template <class V, class C>
inline auto operator==(const checked<V, C>& lhs, const V& rhs) -> bool
{
    return lhs.get() == rhs;
}

template <class V, class C>
auto operator<<(std::ostream& os, const checked<V, C>& value)
    -> std::ostream&
{
    os << value.get();
    return os;
}

}

#endif /* airnet_checked_hpp */
