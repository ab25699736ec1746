#ifndef airnet_cpf_hpp
#define airnet_cpf_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Constant power fan.
/// @details Delivers a volume flow of <code>upo / prise</code> for a
///   pressure rise of <code>prise = -pdrop</code>. Pressure rises below
///   <code>prmin</code> are treated as <code>prmin</code>.
struct cpf
{
    static constexpr auto type_tag = "cpf";

    double upo{}; ///< Useful power output (W).
    double prmin{}; ///< Minimum pressure rise (Pa).
    double ftyp{}; ///< Typical mass flow rate (kg/s).

    friend auto operator==(const cpf&, const cpf&) -> bool = default;
};

/// @throws std::invalid_argument if the minimum pressure rise isn't
///   positive or the power is negative.
auto make_cpf(double upo, double prmin, double ftyp) -> cpf;

/// @note Uses the density of @p n0, the node the fan draws from.
auto calculate(const cpf& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

/// @brief Slope of the typical flow over the minimum pressure rise.
auto linearize(const cpf& e, const node& n0, const node& n1) -> double;

auto operator<<(std::ostream& os, const cpf& value) -> std::ostream&;

}

#endif /* airnet_cpf_hpp */
