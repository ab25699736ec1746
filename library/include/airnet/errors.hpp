#ifndef airnet_errors_hpp
#define airnet_errors_hpp

#include <cstddef> // for std::size_t
#include <stdexcept> // for std::invalid_argument, std::logic_error
#include <string>
#include <utility> // for std::move

#include "airnet/link.hpp"

namespace airnet {

/// @brief Element field absent under every one of its accepted names.
struct missing_argument: std::invalid_argument
{
    missing_argument(std::string field, const std::string& what_arg):
        std::invalid_argument(what_arg), field(std::move(field))
    {}

    /// @brief Primary name of the missing field.
    std::string field;
};

/// @brief Link naming a node or element that doesn't exist.
struct unresolved_reference: std::invalid_argument
{
    unresolved_reference(airnet::link l, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(l))
    {}

    airnet::link value;
};

/// @brief Operation that the element type doesn't define.
struct unimplemented_law: std::logic_error
{
    using std::logic_error::logic_error;
};

/// @brief Malformed network description input.
struct bad_network_input: std::runtime_error
{
    bad_network_input(std::size_t line, const std::string& what_arg):
        std::runtime_error(what_arg), line(line)
    {}

    /// @brief One-based line number at which the problem was found.
    std::size_t line{};
};

}

#endif /* airnet_errors_hpp */
