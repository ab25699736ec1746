#include <cmath> // for std::sqrt

#include "airnet/ckv.hpp"

namespace airnet {

auto calculate(const ckv& e, const node& n0, const node&, double pdrop)
    -> flow_result
{
    auto result = flow_result{};
    const auto dp = pdrop - e.dp0;
    if (dp > 0.0) {
        result.flow1 = e.coef * n0.sqrt_density * std::sqrt(dp);
        result.dflow1 = 0.5 * result.flow1 / dp;
    }
    return result;
}

auto operator<<(std::ostream& os, const ckv& value) -> std::ostream&
{
    os << "ckv{";
    os << ".dp0=" << value.dp0;
    os << ",.coef=" << value.coef;
    os << "}";
    return os;
}

}
