#include "airnet/cfr.hpp"

namespace airnet {

auto calculate(const cfr& e, const node&, const node&, double)
    -> flow_result
{
    auto result = flow_result{};
    result.flow1 = e.flow;
    return result;
}

auto operator<<(std::ostream& os, const cfr& value) -> std::ostream&
{
    os << "cfr{.flow=" << value.flow << "}";
    return os;
}

}
