#ifndef airnet_link_hpp
#define airnet_link_hpp

#include <optional>
#include <ostream>
#include <string>

#include "airnet/name.hpp"

namespace airnet {

/// @brief Airflow path between two nodes through one element.
/// @note Nodes and elements are referred to by name. The model that owns
///   them resolves the names.
/// @note Positive flow is from <code>node0</code> to <code>node1</code>.
struct link
{
    airnet::name name;
    airnet::name node0;
    airnet::name node1;

    /// @brief Height of the opening relative to <code>node0</code> (m).
    double ht0{};

    /// @brief Height of the opening relative to <code>node1</code> (m).
    double ht1{};

    airnet::name element;

    /// @brief Name of the wind pressure modifier if any.
    std::optional<std::string> wind;

    /// @brief Wind pressure modifier.
    double wpmod{};

    /// @brief Flow multiplier.
    double mult{1.0};
};

auto operator==(const link& lhs, const link& rhs) -> bool;

auto operator<<(std::ostream& os, const link& value) -> std::ostream&;

}

#endif /* airnet_link_hpp */
