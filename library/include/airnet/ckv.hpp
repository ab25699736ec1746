#ifndef airnet_ckv_hpp
#define airnet_ckv_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Check valve.
/// @details Closed, passing no flow, until the pressure drop exceeds the
///   cut-off pressure. Flow is only ever from node0 to node1.
struct ckv
{
    static constexpr auto type_tag = "ckv";

    double dp0{}; ///< Cut-off pressure (Pa).
    double coef{}; ///< Flow coefficient.

    friend auto operator==(const ckv&, const ckv&) -> bool = default;
};

auto calculate(const ckv& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const ckv& value) -> std::ostream&;

}

#endif /* airnet_ckv_hpp */
