#ifndef airnet_dwc_hpp
#define airnet_dwc_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Duct with friction and dynamic loss coefficients.
/// @details Laminar flow has the pressure drop
///   <code>(lflc * ld + ldlc) * mu * V / (2 * hdia)</code>, turbulent flow
///   has <code>(f * ld + tdlc) * rho * V^2 / 2</code> with the Darcy friction
///   factor @c f from the Colebrook equation. The lesser flow applies.
/// @see make_dwc.
struct dwc
{
    static constexpr auto type_tag = "dwc";

    double length{}; ///< Length of the duct (m).
    double hdia{}; ///< Hydraulic diameter (m).
    double area{}; ///< Cross sectional area (m^2).
    double rough{}; ///< Roughness dimension (m).
    double tdlc{}; ///< Turbulent dynamic loss coefficient.
    double lflc{}; ///< Laminar friction loss coefficient.
    double ldlc{}; ///< Laminar dynamic loss coefficient.
    double linit{}; ///< Laminar initialization coefficient.
    double ed{}; ///< Relative roughness: rough / hdia.
    double ld{}; ///< Relative length: length / hdia.
    double f{}; ///< Fully rough Darcy friction factor.

    friend auto operator==(const dwc&, const dwc&) -> bool = default;
};

/// @brief Makes a duct element, computing its derived members.
/// @throws std::invalid_argument if the hydraulic diameter or area aren't
///   positive, or if the length or roughness are negative.
auto make_dwc(double length, double hdia, double area, double rough,
              double tdlc, double lflc, double ldlc, double linit) -> dwc;

/// @brief Darcy friction factor from the Colebrook equation.
/// @param[in] ed Relative roughness.
/// @param[in] re Reynolds number. Zero or less gives the fully rough value.
auto friction_factor(double ed, double re) -> double;

/// @brief Calculates the flow through the given duct.
/// @note The turbulent derivative is <code>flow / (2 * pdrop)</code>, which
///   holds the friction factor fixed. Since the friction factor falls as the
///   flow rises, this underestimates the true slope by several percent.
auto calculate(const dwc& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto linearize(const dwc& e, const node& n0, const node& n1) -> double;

auto operator<<(std::ostream& os, const dwc& value) -> std::ostream&;

}

#endif /* airnet_dwc_hpp */
