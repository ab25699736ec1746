#ifndef airnet_prv_hpp
#define airnet_prv_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Pressure relief valve.
/// @details In each direction, flow ramps up linearly to the design flow at
///   the pressure coefficient and grows with the square root of the
///   pressure drop beyond it. A zero design flow blocks that direction.
struct prv
{
    static constexpr auto type_tag = "prv";

    double fpos{}; ///< Design flow rate in the positive direction (kg/s).
    double cpos{}; ///< Positive direction pressure coefficient (Pa).
    double fneg{}; ///< Design flow rate in the negative direction (kg/s).
    double cneg{}; ///< Negative direction pressure coefficient (Pa).

    friend auto operator==(const prv&, const prv&) -> bool = default;
};

/// @throws std::invalid_argument if a design flow is negative, or if a
///   direction with a positive design flow has a pressure coefficient
///   that isn't positive.
auto make_prv(double fpos, double cpos, double fneg, double cneg) -> prv;

auto calculate(const prv& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const prv& value) -> std::ostream&;

}

#endif /* airnet_prv_hpp */
