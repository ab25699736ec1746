#ifndef airnet_cfr_hpp
#define airnet_cfr_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Constant flow rate element.
struct cfr
{
    static constexpr auto type_tag = "cfr";

    double flow{}; ///< Flow rate (kg/s).

    friend auto operator==(const cfr&, const cfr&) -> bool = default;
};

/// @brief Gets the element's flow regardless of the pressure drop.
auto calculate(const cfr& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const cfr& value) -> std::ostream&;

}

#endif /* airnet_cfr_hpp */
