#include <cmath> // for std::abs
#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::pair

#include "airnet/fan.hpp"

namespace airnet {

namespace {

constexpr auto max_iterations = 50;
constexpr auto tolerance = 1.0e-12;

/// @brief Finds the flow in [lo, hi] at which the range gives @p prise.
/// @pre The range's pressure rise at @p lo is at least @p prise, and at
///   @p hi it is at most @p prise.
auto solve(const fan_point& p, double lo, double hi, double prise) -> double
{
    const auto span = hi - lo;
    auto x = 0.5 * (lo + hi);
    for (auto i = 0; i < max_iterations; ++i) {
        const auto g = pressure_rise(p, x) - prise;
        if (g == 0.0) {
            break;
        }
        if (g > 0.0) {
            lo = x;
        }
        else {
            hi = x;
        }
        const auto dg = pressure_rise_slope(p, x);
        auto next = (dg < 0.0)? x - g / dg: 0.5 * (lo + hi);
        if (next <= lo || next >= hi) {
            next = 0.5 * (lo + hi);
        }
        const auto done = std::abs(next - x) <= tolerance * span;
        x = next;
        if (done) {
            break;
        }
    }
    return x;
}

}

auto make_fan(plr leakage, double rdens, double fdf, double sop, double off,
              double mfl, std::vector<fan_point> curve, double speed) -> fan
{
    if (!(rdens > 0.0)) {
        throw std::invalid_argument{"fan reference density must be positive"};
    }
    if (!(fdf > 0.0)) {
        throw std::invalid_argument{"fan free delivery flow must be positive"};
    }
    if (!(sop > 0.0)) {
        throw std::invalid_argument{"fan shut-off pressure must be positive"};
    }
    auto start = mfl;
    for (auto&& point: curve) {
        if (!(point.mf > start)) {
            throw std::invalid_argument{"fan curve flow limits must increase"};
        }
        start = point.mf;
    }
    auto result = fan{};
    static_cast<plr&>(result) = leakage;
    result.rdens = rdens;
    result.fdf = fdf;
    result.sop = sop;
    result.off = off;
    result.speed = speed;
    result.mfl = mfl;
    result.curve = std::move(curve);
    return result;
}

auto invert_curve(const fan& e, double prise) -> std::pair<double, double>
{
    const auto chord = -e.sop / e.fdf;
    if (e.curve.empty()) {
        return {(prise - e.sop) / chord, chord};
    }
    const auto lo_rise = pressure_rise(e.curve.front(), e.mfl);
    if (prise >= lo_rise) {
        return {e.mfl + (prise - lo_rise) / chord, chord};
    }
    const auto hi_flow = e.curve.back().mf;
    const auto hi_rise = pressure_rise(e.curve.back(), hi_flow);
    if (prise <= hi_rise) {
        return {hi_flow + (prise - hi_rise) / chord, chord};
    }
    auto start = e.mfl;
    for (auto&& point: e.curve) {
        if (pressure_rise(point, start) >= prise &&
            pressure_rise(point, point.mf) <= prise) {
            const auto f = solve(point, start, point.mf, prise);
            const auto slope = pressure_rise_slope(point, f);
            return {f, (slope < 0.0)? slope: chord};
        }
        start = point.mf;
    }
    // Curve isn't monotonic or has gaps between ranges.
    return {e.mfl + (prise - lo_rise) / chord, chord};
}

auto calculate(const fan& e, const node& n0, const node& n1, double pdrop)
    -> flow_result
{
    if (e.speed < e.off || !(e.speed > 0.0)) {
        return calculate(static_cast<const plr&>(e), n0, n1, pdrop);
    }
    // Fan laws: mass flow scales with density ratio times speed, and
    // pressure rise with density ratio times speed squared.
    const auto ratio = n0.density / e.rdens;
    const auto flow_scale = ratio * e.speed;
    const auto rise_scale = ratio * e.speed * e.speed;
    const auto [f, slope] = invert_curve(e, -pdrop / rise_scale);
    auto result = flow_result{};
    result.flow1 = flow_scale * f;
    result.dflow1 = -flow_scale / (rise_scale * slope);
    return result;
}

auto operator<<(std::ostream& os, const fan& value) -> std::ostream&
{
    os << "fan{";
    os << ".init=" << value.init;
    os << ",.lam=" << value.lam;
    os << ",.turb=" << value.turb;
    os << ",.expt=" << value.expt;
    os << ",.rdens=" << value.rdens;
    os << ",.fdf=" << value.fdf;
    os << ",.sop=" << value.sop;
    os << ",.off=" << value.off;
    os << ",.speed=" << value.speed;
    os << ",.mfl=" << value.mfl;
    os << ",.curve={";
    auto prefix = "";
    for (auto&& point: value.curve) {
        os << prefix << "{" << point.a1 << "," << point.a2 << ",";
        os << point.a3 << "," << point.a4 << "," << point.mf << "}";
        prefix = ",";
    }
    os << "}";
    os << "}";
    return os;
}

}
