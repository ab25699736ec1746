#include <algorithm> // for std::max
#include <cmath> // for std::abs, std::sqrt
#include <stdexcept> // for std::invalid_argument

#include "airnet/qfr.hpp"

namespace airnet {

namespace {

/// @brief Smallest pressure drop magnitude for the slope (Pa).
/// @note Keeps the slope finite at zero when there's no linear term.
constexpr auto min_slope_pdrop = 1.0e-6;

}

auto make_qfr(double a, double b) -> qfr
{
    if (a < 0.0 || b < 0.0) {
        throw std::invalid_argument{"qfr coefficients may not be negative"};
    }
    if (a == 0.0 && b == 0.0) {
        throw std::invalid_argument{"qfr needs a non-zero coefficient"};
    }
    return qfr{a, b};
}

auto calculate(const qfr& e, const node&, const node&, double pdrop)
    -> flow_result
{
    auto result = flow_result{};
    const auto dp = std::abs(pdrop);
    const auto root = std::sqrt(e.a * e.a + 4.0 * e.b * dp);
    // Equivalent to (root - a) / (2 b) without cancellation, and defined
    // for b == 0.
    const auto f = 2.0 * dp / (e.a + root);
    result.flow1 = (pdrop < 0.0)? -f: f;
    result.dflow1 = 1.0 / std::sqrt(e.a * e.a
                                    + 4.0 * e.b * std::max(dp, min_slope_pdrop));
    return result;
}

auto operator<<(std::ostream& os, const qfr& value) -> std::ostream&
{
    os << "qfr{";
    os << ".a=" << value.a;
    os << ",.b=" << value.b;
    os << "}";
    return os;
}

}
