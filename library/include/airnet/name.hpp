#ifndef airnet_name_hpp
#define airnet_name_hpp

#include <concepts> // for std::regular.
#include <cstddef> // for std::size_t
#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

#include "airnet/checked.hpp"

namespace airnet {

/// @brief Name having a character that names may not contain.
struct bad_name: std::invalid_argument
{
    bad_name(char badc, std::size_t pos, const std::string& what_arg);

    [[nodiscard]] auto badchar() const noexcept -> char;
    [[nodiscard]] auto position() const noexcept -> std::size_t;

private:
    std::size_t position_{};
    char badchar_{};
};

struct name_checker
{
    /// @brief Denied characters: whitespace and the comment prefix.
    static constexpr auto denied = std::string_view{" \t\n\v\f\r!"};

    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    /// @throws std::invalid_argument if @p v is empty.
    /// @throws bad_name if @p v has a denied character.
    auto operator()(std::string v) const -> std::string;

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }
};

/// @brief Name of a node, element or link.
/// @details A lexical token as it appears in a network description file:
///   non-empty, free of whitespace, and free of the comment character.
/// @note Default constructed names are empty and never compare equal to a
///   name read from a file.
using name = detail::checked<std::string, name_checker>;

static_assert(std::regular<name>);

}

#endif /* airnet_name_hpp */
