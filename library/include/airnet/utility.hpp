#ifndef airnet_utility_hpp
#define airnet_utility_hpp

#include <ostream>
#include <streambuf>
#include <type_traits> // for std::underlying_type_t

namespace airnet {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Converts the given enumerate into its underlying value.
/// @note This is basically a back port from C++23.
template <class Enum>
constexpr auto to_underlying(Enum e) noexcept ->
    decltype(static_cast<std::underlying_type_t<Enum>>(e))
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

/// @brief Output stream that discards everything written to it.
/// @note For use as a diagnostics stream when diagnostics aren't wanted.
auto null_ostream() -> std::ostream&;

}

#endif /* airnet_utility_hpp */
