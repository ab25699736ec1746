#ifndef airnet_qfr_hpp
#define airnet_qfr_hpp

#include <ostream>

#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"

namespace airnet {

/// @brief Quadratic flow resistance: <code>pdrop = a * f + b * f^2</code>.
struct qfr
{
    static constexpr auto type_tag = "qfr";

    double a{};
    double b{};

    friend auto operator==(const qfr&, const qfr&) -> bool = default;
};

/// @throws std::invalid_argument if either coefficient is negative or if
///   both are zero.
auto make_qfr(double a, double b) -> qfr;

auto calculate(const qfr& e, const node& n0, const node& n1, double pdrop)
    -> flow_result;

auto operator<<(std::ostream& os, const qfr& value) -> std::ostream&;

}

#endif /* airnet_qfr_hpp */
