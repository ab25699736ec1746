#include <cmath> // for std::pow

#include "airnet/plr.hpp"

namespace airnet {

auto calculate(const plr& e, const node& n0, const node& n1, double pdrop)
    -> flow_result
{
    auto result = flow_result{};
    if (pdrop > 0.0) {
        const auto cdm = e.lam * n0.dvisc;
        const auto fl = cdm * pdrop;
        const auto ft = e.turb * n0.sqrt_density * std::pow(pdrop, e.expt);
        if (fl <= ft) {
            result.flow1 = fl;
            result.dflow1 = cdm;
        }
        else {
            result.flow1 = ft;
            result.dflow1 = ft * e.expt / pdrop;
        }
    }
    else if (pdrop < 0.0) {
        const auto cdm = e.lam * n1.dvisc;
        const auto fl = cdm * pdrop;
        const auto ft = -e.turb * n1.sqrt_density * std::pow(-pdrop, e.expt);
        if (fl >= ft) {
            result.flow1 = fl;
            result.dflow1 = cdm;
        }
        else {
            result.flow1 = ft;
            result.dflow1 = ft * e.expt / pdrop;
        }
    }
    else {
        // Averages both nodes where the other branches each use only one.
        result.dflow1 = 0.5 * e.lam * (n0.dvisc + n1.dvisc);
    }
    return result;
}

auto linearize(const plr& e, const node& n0, const node& n1) -> double
{
    return 0.5 * e.init * (n0.dvisc + n1.dvisc);
}

auto operator<<(std::ostream& os, const plr& value) -> std::ostream&
{
    os << "plr{";
    os << ".init=" << value.init;
    os << ",.lam=" << value.lam;
    os << ",.turb=" << value.turb;
    os << ",.expt=" << value.expt;
    os << "}";
    return os;
}

}
