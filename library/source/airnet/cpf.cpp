#include <stdexcept> // for std::invalid_argument

#include "airnet/cpf.hpp"

namespace airnet {

auto make_cpf(double upo, double prmin, double ftyp) -> cpf
{
    if (!(prmin > 0.0)) {
        throw std::invalid_argument{"cpf minimum pressure rise must be positive"};
    }
    if (upo < 0.0) {
        throw std::invalid_argument{"cpf power may not be negative"};
    }
    return cpf{upo, prmin, ftyp};
}

auto calculate(const cpf& e, const node& n0, const node&, double pdrop)
    -> flow_result
{
    auto result = flow_result{};
    const auto prise = -pdrop;
    if (prise > e.prmin) {
        result.flow1 = n0.density * e.upo / prise;
        result.dflow1 = result.flow1 / prise;
    }
    else {
        result.flow1 = n0.density * e.upo / e.prmin;
    }
    return result;
}

auto linearize(const cpf& e, const node&, const node&) -> double
{
    return e.ftyp / e.prmin;
}

auto operator<<(std::ostream& os, const cpf& value) -> std::ostream&
{
    os << "cpf{";
    os << ".upo=" << value.upo;
    os << ",.prmin=" << value.prmin;
    os << ",.ftyp=" << value.ftyp;
    os << "}";
    return os;
}

}
