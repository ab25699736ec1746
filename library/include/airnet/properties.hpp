#ifndef airnet_properties_hpp
#define airnet_properties_hpp

namespace airnet {

/// @brief Density of air (kg/m^3) from the ideal gas law.
/// @param[in] temperature Absolute temperature (K).
/// @param[in] pressure Gauge pressure (Pa).
/// @note Temperatures of zero give non-finite results. That's for the
///   caller to avoid.
auto air_density(double temperature, double pressure) noexcept -> double;

/// @brief Dynamic viscosity of air (Pa s) at the given absolute temperature.
auto air_viscosity(double temperature) noexcept -> double;

}

#endif /* airnet_properties_hpp */
