#include <algorithm> // for std::max
#include <cmath> // for std::abs, std::log10, std::pow, std::sqrt
#include <stdexcept> // for std::invalid_argument

#include "airnet/dwc.hpp"

namespace airnet {

namespace {

constexpr auto smooth_friction_factor = 0.02;
constexpr auto min_turbulent_reynolds = 2000.0;
constexpr auto max_iterations = 20;
constexpr auto tolerance = 1.0e-8;

/// @brief Coefficient of the laminar flow: flow = coefficient * dvisc * pdrop.
/// @return Zero if the element has no laminar losses.
auto laminar_coefficient(const dwc& e) noexcept -> double
{
    const auto losses = e.lflc * e.ld + e.ldlc;
    return (losses > 0.0)? 2.0 * e.area * e.hdia / losses: 0.0;
}

/// @brief Magnitude of the turbulent flow for the magnitude of pressure drop.
auto turbulent_flow(const dwc& e, const node& n, double dp) -> double
{
    auto f = e.f;
    for (auto i = 0; i < max_iterations; ++i) {
        const auto losses = f * e.ld + e.tdlc;
        const auto flow = e.area * std::sqrt(2.0 * n.density * dp / losses);
        const auto re = flow * e.hdia / (e.area * n.viscosity);
        const auto next = friction_factor(e.ed, re);
        const auto done = std::abs(next - f) <= tolerance * f;
        f = next;
        if (done) {
            break;
        }
    }
    return e.area * std::sqrt(2.0 * n.density * dp / (f * e.ld + e.tdlc));
}

auto one_way(const dwc& e, const node& n, double dp, double sign)
    -> flow_result
{
    auto result = flow_result{};
    const auto cl = laminar_coefficient(e);
    const auto ft = turbulent_flow(e, n, dp);
    if (cl > 0.0) {
        const auto fl = cl * n.dvisc * dp;
        if (fl <= ft) {
            result.flow1 = sign * fl;
            result.dflow1 = cl * n.dvisc;
            return result;
        }
    }
    result.flow1 = sign * ft;
    result.dflow1 = 0.5 * ft / dp;
    return result;
}

}

auto make_dwc(double length, double hdia, double area, double rough,
              double tdlc, double lflc, double ldlc, double linit) -> dwc
{
    if (!(hdia > 0.0)) {
        throw std::invalid_argument{"duct hydraulic diameter must be positive"};
    }
    if (!(area > 0.0)) {
        throw std::invalid_argument{"duct area must be positive"};
    }
    if (length < 0.0) {
        throw std::invalid_argument{"duct length may not be negative"};
    }
    if (rough < 0.0) {
        throw std::invalid_argument{"duct roughness may not be negative"};
    }
    auto result = dwc{};
    result.length = length;
    result.hdia = hdia;
    result.area = area;
    result.rough = rough;
    result.tdlc = tdlc;
    result.lflc = lflc;
    result.ldlc = ldlc;
    result.linit = linit;
    result.ed = rough / hdia;
    result.ld = length / hdia;
    result.f = friction_factor(result.ed, 0.0);
    if (!(result.f * result.ld + result.tdlc > 0.0)) {
        throw std::invalid_argument{"duct has no turbulent losses"};
    }
    return result;
}

auto friction_factor(double ed, double re) -> double
{
    if (re <= 0.0) {
        if (ed <= 0.0) {
            return smooth_friction_factor;
        }
        const auto x = std::log10(ed / 3.7);
        return 0.25 / (x * x);
    }
    // The Colebrook equation only holds for turbulent flow.
    re = std::max(re, min_turbulent_reynolds);
    // Swamee-Jain for the first estimate, then fixed point iteration on
    // x = 1 / sqrt(f).
    const auto sj = std::log10(ed / 3.7 + 5.74 / std::pow(re, 0.9));
    auto x = -2.0 * sj;
    for (auto i = 0; i < max_iterations; ++i) {
        const auto next = -2.0 * std::log10(ed / 3.7 + 2.51 * x / re);
        const auto done = std::abs(next - x) <= tolerance * x;
        x = next;
        if (done) {
            break;
        }
    }
    return 1.0 / (x * x);
}

auto calculate(const dwc& e, const node& n0, const node& n1, double pdrop)
    -> flow_result
{
    if (pdrop > 0.0) {
        return one_way(e, n0, pdrop, 1.0);
    }
    if (pdrop < 0.0) {
        return one_way(e, n1, -pdrop, -1.0);
    }
    auto result = flow_result{};
    const auto cl = laminar_coefficient(e);
    result.dflow1 = (cl > 0.0)
        ? 0.5 * cl * (n0.dvisc + n1.dvisc)
        : linearize(e, n0, n1);
    return result;
}

auto linearize(const dwc& e, const node& n0, const node& n1) -> double
{
    return 0.5 * e.linit * (n0.dvisc + n1.dvisc);
}

auto operator<<(std::ostream& os, const dwc& value) -> std::ostream&
{
    os << "dwc{";
    os << ".length=" << value.length;
    os << ",.hdia=" << value.hdia;
    os << ",.area=" << value.area;
    os << ",.rough=" << value.rough;
    os << ",.tdlc=" << value.tdlc;
    os << ",.lflc=" << value.lflc;
    os << ",.ldlc=" << value.ldlc;
    os << ",.linit=" << value.linit;
    os << "}";
    return os;
}

}
