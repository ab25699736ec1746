#include "airnet/flow_result.hpp"

namespace airnet {

auto operator<<(std::ostream& os, const flow_result& value) -> std::ostream&
{
    os << "flow_result{";
    os << ".count=" << value.count;
    os << ",.flow1=" << value.flow1;
    os << ",.dflow1=" << value.dflow1;
    if (value.count > 1) {
        os << ",.flow2=" << value.flow2;
        os << ",.dflow2=" << value.dflow2;
    }
    os << "}";
    return os;
}

}
