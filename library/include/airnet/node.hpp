#ifndef airnet_node_hpp
#define airnet_node_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>

#include "airnet/name.hpp"

namespace airnet {

/// @brief Zone of the airflow network.
/// @note The derived members (<code>density</code> through
///   <code>sqrt_density</code>) are only written by
///   <code>set_properties</code>.
/// @see set_properties.
struct node
{
    static constexpr auto default_temperature = 293.15;

    airnet::name name;

    /// @brief Whether the pressure is an unknown rather than a fixed
    ///   boundary condition.
    bool variable{true};

    double height{}; ///< m
    double temperature{default_temperature}; ///< K
    double pressure{}; ///< Pa, gauge.

    /// @brief Position of this node in the model's system of equations.
    /// @note Only set for variable nodes.
    std::optional<std::size_t> index;

    double density{};
    double viscosity{};
    double dvisc{}; ///< Density divided by viscosity.
    double sqrt_density{};
};

/// @brief Recomputes the derived properties of the given node from its
///   temperature and pressure.
auto set_properties(node& n) noexcept -> void;

auto operator<<(std::ostream& os, const node& value) -> std::ostream&;

}

#endif /* airnet_node_hpp */
