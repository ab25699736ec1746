#include <string>

#include "airnet/element.hpp"
#include "airnet/errors.hpp"
#include "airnet/utility.hpp"

namespace airnet {

static_assert(std::variant_size_v<element> ==
              to_underlying(element_type::prv) + 1u);

auto type_of(const element& value) noexcept -> element_type
{
    return static_cast<element_type>(value.index());
}

auto calculate(const element& value, const node& n0, const node& n1,
               double pdrop) -> flow_result
{
    return std::visit([&](const auto& e){
        return calculate(e, n0, n1, pdrop);
    }, value);
}

auto linearize(const element& value, const node& n0, const node& n1)
    -> double
{
    return std::visit(detail::overloaded{
        [&](const plr& e) { return linearize(e, n0, n1); },
        [&](const dor& e) { return linearize(static_cast<const plr&>(e), n0, n1); },
        [&](const fan& e) { return linearize(static_cast<const plr&>(e), n0, n1); },
        [&](const dwc& e) { return linearize(e, n0, n1); },
        [&](const cpf& e) { return linearize(e, n0, n1); },
        [&](const auto& e) -> double {
            throw unimplemented_law{
                std::string{e.type_tag} + " element has no linearization"
            };
        },
    }, value);
}

auto operator<<(std::ostream& os, element_type value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto operator<<(std::ostream& os, const element& value) -> std::ostream&
{
    std::visit([&os](const auto& e) { os << e; }, value);
    return os;
}

}
