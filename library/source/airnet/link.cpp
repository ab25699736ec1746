#include "airnet/link.hpp"

namespace airnet {

auto operator==(const link& lhs, const link& rhs) -> bool
{
    return (lhs.name == rhs.name)
        && (lhs.node0 == rhs.node0)
        && (lhs.node1 == rhs.node1)
        && (lhs.ht0 == rhs.ht0)
        && (lhs.ht1 == rhs.ht1)
        && (lhs.element == rhs.element)
        && (lhs.wind == rhs.wind)
        && (lhs.wpmod == rhs.wpmod)
        && (lhs.mult == rhs.mult);
}

auto operator<<(std::ostream& os, const link& value) -> std::ostream&
{
    os << "link{";
    os << ".name=" << value.name;
    os << ",.node0=" << value.node0;
    os << ",.ht0=" << value.ht0;
    os << ",.node1=" << value.node1;
    os << ",.ht1=" << value.ht1;
    os << ",.element=" << value.element;
    if (value.wind) {
        os << ",.wind=" << *value.wind;
        os << ",.wpmod=" << value.wpmod;
    }
    if (value.mult != 1.0) {
        os << ",.mult=" << value.mult;
    }
    os << "}";
    return os;
}

}
