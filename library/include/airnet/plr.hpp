#ifndef airnet_plr_hpp
#define airnet_plr_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Power law resistance element.
/// @details Flow is the lesser of a laminar flow, linear in pressure drop,
///   and a turbulent flow, proportional to the pressure drop raised to the
///   turbulent exponent. Describes orifices, cracks and leakage areas.
struct plr
{
    static constexpr auto type_tag = "plr";
    static constexpr auto default_expt = 0.5;

    double init{}; ///< Laminar initialization coefficient.
    double lam{}; ///< Laminar flow coefficient.
    double turb{}; ///< Turbulent flow coefficient.
    double expt{default_expt}; ///< Turbulent flow exponent.

    friend auto operator==(const plr&, const plr&) -> bool = default;
};

/// @brief Calculates the flow through the given element.
/// @note Flow for positive pressure drops uses the properties of @p n0,
///   flow for negative pressure drops uses those of @p n1, and the slope at
///   zero averages the two.
auto calculate(const plr& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

/// @brief Slope to use before any pressure drop is known.
auto linearize(const plr& e, const node& n0, const node& n1) -> double;

auto operator<<(std::ostream& os, const plr& value) -> std::ostream&;

}

#endif /* airnet_plr_hpp */
