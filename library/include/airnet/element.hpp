#ifndef airnet_element_hpp
#define airnet_element_hpp

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>
#include <variant>

#include "airnet/cfr.hpp"
#include "airnet/ckv.hpp"
#include "airnet/cpf.hpp"
#include "airnet/dor.hpp"
#include "airnet/dwc.hpp"
#include "airnet/fan.hpp"
#include "airnet/flow_result.hpp"
#include "airnet/node.hpp"
#include "airnet/plr.hpp"
#include "airnet/prv.hpp"
#include "airnet/qfr.hpp"

namespace airnet {

/// @brief Flow element.
/// @note The alternatives are in the same order as <code>element_type</code>.
using element = std::variant<plr, dwc, qfr, dor, cfr, fan, cpf, ckv, prv>;

enum class element_type: unsigned {
    plr, dwc, qfr, dor, cfr, fan, cpf, ckv, prv,
};

constexpr auto to_cstring(element_type value) noexcept -> const char*
{
    switch (value) {
    case element_type::plr: return plr::type_tag;
    case element_type::dwc: return dwc::type_tag;
    case element_type::qfr: return qfr::type_tag;
    case element_type::dor: return dor::type_tag;
    case element_type::cfr: return cfr::type_tag;
    case element_type::fan: return fan::type_tag;
    case element_type::cpf: return cpf::type_tag;
    case element_type::ckv: return ckv::type_tag;
    case element_type::prv: return prv::type_tag;
    }
    return "unknown";
}

constexpr auto to_element_type(const std::string_view& s)
    -> std::optional<element_type>
{
    for (const auto type: std::initializer_list<element_type>{
        element_type::plr, element_type::dwc, element_type::qfr,
        element_type::dor, element_type::cfr, element_type::fan,
        element_type::cpf, element_type::ckv, element_type::prv,
    }) {
        if (s == to_cstring(type)) {
            return type;
        }
    }
    return {};
}

auto type_of(const element& value) noexcept -> element_type;

/// @brief Calculates the flow through the given element.
/// @param[in] value Element whose law to evaluate.
/// @param[in] n0 Node flow comes from for a positive pressure drop.
/// @param[in] n1 Node flow comes from for a negative pressure drop.
/// @param[in] pdrop Pressure drop from @p n0 to @p n1 (Pa).
auto calculate(const element& value, const node& n0, const node& n1,
               double pdrop) -> flow_result;

/// @brief Slope of flow with respect to pressure drop to start from.
/// @throws unimplemented_law if the element has no initialization
///   coefficient.
auto linearize(const element& value, const node& n0, const node& n1)
    -> double;

auto operator<<(std::ostream& os, element_type value) -> std::ostream&;

auto operator<<(std::ostream& os, const element& value) -> std::ostream&;

}

#endif /* airnet_element_hpp */
