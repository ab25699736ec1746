#ifndef airnet_fan_hpp
#define airnet_fan_hpp

#include <ostream>
#include <utility> // for std::pair
#include <vector>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"
#include "airnet/plr.hpp"

namespace airnet {

/// @brief Range of a fan performance curve.
/// @details Pressure rise as a cubic in mass flow:
///   <code>a1 + a2 * f + a3 * f^2 + a4 * f^3</code>, for flows from the end
///   of the previous range up to <code>mf</code>.
struct fan_point
{
    double a1{};
    double a2{};
    double a3{};
    double a4{};
    double mf{}; ///< Upper flow limit of the range (kg/s).

    friend auto operator==(const fan_point&, const fan_point&) -> bool = default;
};

/// @brief Pressure rise of the given range at the given flow.
constexpr auto pressure_rise(const fan_point& p, double f) noexcept -> double
{
    return p.a1 + f * (p.a2 + f * (p.a3 + f * p.a4));
}

/// @brief Slope of the pressure rise of the given range at the given flow.
constexpr auto pressure_rise_slope(const fan_point& p, double f) noexcept
    -> double
{
    return p.a2 + f * (2.0 * p.a3 + f * 3.0 * p.a4);
}

/// @brief Fan with a performance curve.
/// @details The curve is for air at the reference density and for the
///   rated speed. Other densities and speeds are accounted for with the fan
///   laws. A fan running below <code>off</code> times its rated speed, or
///   not running at all, is off and leaks according to its power law
///   coefficients.
/// @note The fan pushes air from node0 to node1.
/// @see make_fan.
struct fan: plr
{
    static constexpr auto type_tag = "fan";
    static constexpr auto default_speed = 1.0;

    double rdens{}; ///< Reference density (kg/m^3).
    double fdf{}; ///< Free delivery flow: flow at no pressure rise (kg/s).
    double sop{}; ///< Shut-off pressure: pressure rise at no flow (Pa).
    double off{}; ///< Fan is off if relative speed is below this.
    double speed{default_speed}; ///< Speed relative to the rated speed.
    double mfl{}; ///< Lower flow limit of the first curve range (kg/s).
    std::vector<fan_point> curve;

    friend auto operator==(const fan&, const fan&) -> bool = default;
};

/// @brief Makes a fan element checking its curve data.
/// @throws std::invalid_argument if the reference density, free delivery
///   flow or shut-off pressure aren't positive, or if the curve's upper flow
///   limits aren't increasing from <code>mfl</code>.
auto make_fan(plr leakage, double rdens, double fdf, double sop, double off,
              double mfl, std::vector<fan_point> curve,
              double speed = fan::default_speed) -> fan;

/// @brief Reference flow at which the curve gives the pressure rise.
/// @return Flow and slope of the pressure rise with respect to flow there.
/// @note Outside the curve, pressure rise is extended linearly using the
///   slope between the shut-off pressure and free delivery flow.
auto invert_curve(const fan& e, double prise) -> std::pair<double, double>;

auto calculate(const fan& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const fan& value) -> std::ostream&;

}

#endif /* airnet_fan_hpp */
