#include "airnet/constants.hpp"
#include "airnet/properties.hpp"

namespace airnet {

namespace {

// Linear fit of the viscosity of air about 0 C.
constexpr auto viscosity_at_freezing = 1.71432e-5;
constexpr auto viscosity_slope = 4.828e-8;

}

auto air_density(double temperature, double pressure) noexcept -> double
{
    return air_gas_factor * (standard_pressure + pressure) / temperature;
}

auto air_viscosity(double temperature) noexcept -> double
{
    return viscosity_at_freezing
        + viscosity_slope * (temperature - celsius_offset);
}

}
