#include <cmath> // for std::sqrt

#include "airnet/node.hpp"
#include "airnet/properties.hpp"

namespace airnet {

auto set_properties(node& n) noexcept -> void
{
    n.density = air_density(n.temperature, n.pressure);
    n.sqrt_density = std::sqrt(n.density);
    n.viscosity = air_viscosity(n.temperature);
    n.dvisc = n.density / n.viscosity;
}

auto operator<<(std::ostream& os, const node& value) -> std::ostream&
{
    os << "node{";
    os << ".name=" << value.name;
    os << ",.variable=" << (value.variable? "true": "false");
    os << ",.height=" << value.height;
    os << ",.temperature=" << value.temperature;
    os << ",.pressure=" << value.pressure;
    if (value.index) {
        os << ",.index=" << *value.index;
    }
    os << ",.density=" << value.density;
    os << "}";
    return os;
}

}
