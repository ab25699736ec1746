#ifndef airnet_constants_hpp
#define airnet_constants_hpp

namespace airnet {

/// @brief Gravitational acceleration (m/s^2).
constexpr auto gravity = 9.8;

/// @brief Standard atmospheric pressure (Pa).
/// @note Node pressures are gauge pressures relative to this.
constexpr auto standard_pressure = 101325.0;

/// @brief Offset between the Celsius and Kelvin scales.
constexpr auto celsius_offset = 273.15;

/// @brief Ideal gas law constant for dry air: 1 / R_air (kg K / J).
constexpr auto air_gas_factor = 0.0034838;

}

#endif /* airnet_constants_hpp */
