#include <cmath> // for std::abs, std::sqrt

#include "airnet/constants.hpp"
#include "airnet/dor.hpp"

namespace airnet {

namespace {

constexpr auto sqrt2 = 1.414214;

/// @brief Flow and slope of the part of an opening that's between the
///   neutral level and a point @p dist away from it.
/// @note Neither includes the square root of the source density.
struct partial_flow
{
    double flow{};
    double slope{};
};

auto integrate(double c, double gdrho, double dist) noexcept -> partial_flow
{
    const auto abs_gdrho = std::abs(gdrho);
    const auto abs_dist = std::abs(dist);
    const auto root = c * std::sqrt(2.0 * abs_gdrho * abs_dist);
    return {(2.0 / 3.0) * root * abs_dist, root / abs_gdrho};
}

}

auto calculate(const dor& e, const node& n0, const node& n1, double pdrop)
    -> flow_result
{
    const auto drho = n0.density - n1.density;
    const auto gdrho = gravity * drho;
    const auto dtemp = n0.temperature - n1.temperature;
    if (std::abs(dtemp) < e.dtmin) {
        return calculate(static_cast<const plr&>(e), n0, n1,
                         pdrop - 0.5 * e.ht * gdrho);
    }
    if (gdrho == 0.0) {
        return calculate(static_cast<const plr&>(e), n0, n1, pdrop);
    }

    const auto c = sqrt2 * e.wd * e.cd;
    const auto y = pdrop / gdrho; // height of the neutral level
    const auto bottom = integrate(c, gdrho, y);
    const auto top = integrate(c, gdrho, e.ht - y);

    // Below the neutral level, flow goes in the direction of the sign of
    // drho: out of the denser node. Above, it goes the other way.
    // A neutral level below the opening weights the one-way flow by the
    // denser node, one above it by the lighter node.
    const auto& denser = (drho > 0.0)? n0: n1;
    const auto& lighter = (drho > 0.0)? n1: n0;
    const auto down = (drho > 0.0)? 1.0: -1.0;

    auto result = flow_result{};
    if (y < 0.0) {
        result.flow1 = -down * denser.sqrt_density * (top.flow - bottom.flow);
        result.dflow1 = denser.sqrt_density * (top.slope - bottom.slope);
    }
    else if (y > e.ht) {
        result.flow1 = down * lighter.sqrt_density * (bottom.flow - top.flow);
        result.dflow1 = lighter.sqrt_density * (bottom.slope - top.slope);
    }
    else {
        result.count = 2;
        result.flow1 = down * denser.sqrt_density * bottom.flow;
        result.dflow1 = denser.sqrt_density * bottom.slope;
        result.flow2 = -down * lighter.sqrt_density * top.flow;
        result.dflow2 = lighter.sqrt_density * top.slope;
    }
    return result;
}

auto operator<<(std::ostream& os, const dor& value) -> std::ostream&
{
    os << "dor{";
    os << ".init=" << value.init;
    os << ",.lam=" << value.lam;
    os << ",.turb=" << value.turb;
    os << ",.expt=" << value.expt;
    os << ",.dtmin=" << value.dtmin;
    os << ",.ht=" << value.ht;
    os << ",.wd=" << value.wd;
    os << ",.cd=" << value.cd;
    os << "}";
    return os;
}

}
