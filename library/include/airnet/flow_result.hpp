#ifndef airnet_flow_result_hpp
#define airnet_flow_result_hpp

#include <ostream>

namespace airnet {

/// @brief Result of evaluating a flow element at some pressure drop.
/// @note <code>flow2</code> and <code>dflow2</code> are only meaningful
///   when <code>count</code> is 2, i.e. for simultaneous flow in both
///   directions, and are zero otherwise.
struct flow_result
{
    /// @brief Number of flow branches: 1 or 2.
    int count{1};

    double flow1{}; ///< kg/s
    double flow2{}; ///< kg/s
    double dflow1{}; ///< d(flow1)/d(pressure drop)
    double dflow2{}; ///< d(flow2)/d(pressure drop)
};

constexpr auto operator==(const flow_result& lhs,
                          const flow_result& rhs) noexcept -> bool
{
    return (lhs.count == rhs.count)
        && (lhs.flow1 == rhs.flow1)
        && (lhs.flow2 == rhs.flow2)
        && (lhs.dflow1 == rhs.dflow1)
        && (lhs.dflow2 == rhs.dflow2);
}

/// @brief Total flow over all branches.
constexpr auto net_flow(const flow_result& value) noexcept -> double
{
    return value.flow1 + value.flow2;
}

auto operator<<(std::ostream& os, const flow_result& value) -> std::ostream&;

}

#endif /* airnet_flow_result_hpp */
