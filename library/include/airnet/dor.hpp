#ifndef airnet_dor_hpp
#define airnet_dor_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"
#include "airnet/plr.hpp"

namespace airnet {

/// @brief Doorway element.
/// @details A large vertical opening. When the temperatures on either side
///   differ by at least <code>dtmin</code>, the stack effect can drive flow
///   in both directions at once: one way below the neutral pressure level
///   and the other way above it. Otherwise the opening acts as its power
///   law evaluated at mid-height.
struct dor: plr
{
    static constexpr auto type_tag = "dor";

    double dtmin{}; ///< Minimum temperature difference for two-way flow (K).
    double ht{}; ///< Height of the doorway (m).
    double wd{}; ///< Width of the doorway (m).
    double cd{}; ///< Discharge coefficient.

    friend auto operator==(const dor&, const dor&) -> bool = default;
};

/// @brief Calculates the flow through the given doorway.
/// @return Result having a count of 2 if the neutral level lies within the
///   height of the doorway, or 1 otherwise.
auto calculate(const dor& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const dor& value) -> std::ostream&;

}

#endif /* airnet_dor_hpp */
