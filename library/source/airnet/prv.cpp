#include <cmath> // for std::sqrt
#include <stdexcept> // for std::invalid_argument

#include "airnet/prv.hpp"

namespace airnet {

namespace {

auto check(double design_flow, double coefficient) -> void
{
    if (design_flow < 0.0) {
        throw std::invalid_argument{"prv design flow may not be negative"};
    }
    if (design_flow > 0.0 && !(coefficient > 0.0)) {
        throw std::invalid_argument{"prv pressure coefficient must be positive"};
    }
}

auto ramp_slope(double design_flow, double coefficient) noexcept -> double
{
    return (design_flow > 0.0)? design_flow / coefficient: 0.0;
}

/// @brief Flow magnitude and slope for a pressure drop magnitude @p dp.
auto one_way(double design_flow, double coefficient, double dp)
    -> flow_result
{
    auto result = flow_result{};
    if (design_flow > 0.0) {
        if (dp <= coefficient) {
            result.dflow1 = design_flow / coefficient;
            result.flow1 = result.dflow1 * dp;
        }
        else {
            result.flow1 = design_flow * std::sqrt(dp / coefficient);
            result.dflow1 = 0.5 * result.flow1 / dp;
        }
    }
    return result;
}

}

auto make_prv(double fpos, double cpos, double fneg, double cneg) -> prv
{
    check(fpos, cpos);
    check(fneg, cneg);
    return prv{fpos, cpos, fneg, cneg};
}

auto calculate(const prv& e, const node&, const node&, double pdrop)
    -> flow_result
{
    if (pdrop > 0.0) {
        return one_way(e.fpos, e.cpos, pdrop);
    }
    if (pdrop < 0.0) {
        auto result = one_way(e.fneg, e.cneg, -pdrop);
        result.flow1 = -result.flow1;
        return result;
    }
    auto result = flow_result{};
    result.dflow1 = 0.5 * (ramp_slope(e.fpos, e.cpos)
                           + ramp_slope(e.fneg, e.cneg));
    return result;
}

auto operator<<(std::ostream& os, const prv& value) -> std::ostream&
{
    os << "prv{";
    os << ".fpos=" << value.fpos;
    os << ",.cpos=" << value.cpos;
    os << ",.fneg=" << value.fneg;
    os << ",.cneg=" << value.cneg;
    os << "}";
    return os;
}

}
