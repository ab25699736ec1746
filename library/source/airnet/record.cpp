#include <stdexcept> // for std::invalid_argument
#include <string>

#include "airnet/errors.hpp"
#include "airnet/record.hpp"
#include "airnet/utility.hpp"

namespace airnet {

namespace {

constexpr auto init_field = field_alias{"init", "linit", {}};
constexpr auto lam_field = field_alias{"lam", "laminar", {}};
constexpr auto turb_field = field_alias{"turb", "turbulent", {}};
constexpr auto expt_field = field_alias{"expt", "exponent", plr::default_expt};

constexpr auto length_field = field_alias{"length", "len", {}};
constexpr auto hdia_field = field_alias{"hdia", "dh", {}};
constexpr auto area_field = field_alias{"area", "", {}};
constexpr auto rough_field = field_alias{"rough", "rgh", {}};
constexpr auto tdlc_field = field_alias{"tdlc", "", {}};
constexpr auto lflc_field = field_alias{"lflc", "", {}};
constexpr auto ldlc_field = field_alias{"ldlc", "", {}};
constexpr auto linit_field = field_alias{"linit", "init", {}};

constexpr auto a_field = field_alias{"a", "", {}};
constexpr auto b_field = field_alias{"b", "", {}};

constexpr auto dtmin_field = field_alias{"dtmin", "", {}};
constexpr auto ht_field = field_alias{"ht", "height", {}};
constexpr auto wd_field = field_alias{"wd", "width", {}};
constexpr auto cd_field = field_alias{"cd", "discharge", {}};

constexpr auto flow_field = field_alias{"flow", "", {}};

constexpr auto rdens_field = field_alias{"rdens", "", {}};
constexpr auto fdf_field = field_alias{"fdf", "", {}};
constexpr auto sop_field = field_alias{"sop", "", {}};
constexpr auto off_field = field_alias{"off", "ltt", {}};
constexpr auto mfl_field = field_alias{"mfl", "", {}};
constexpr auto speed_field = field_alias{"speed", "", fan::default_speed};

constexpr auto upo_field = field_alias{"upo", "", {}};
constexpr auto prmin_field = field_alias{"prmin", "", {}};
constexpr auto ftyp_field = field_alias{"ftyp", "ftype", {}};

constexpr auto dp0_field = field_alias{"dp0", "", {}};
constexpr auto coef_field = field_alias{"coef", "coeff", {}};

constexpr auto fpos_field = field_alias{"fpos", "", {}};
constexpr auto cpos_field = field_alias{"cpos", "", {}};
constexpr auto fneg_field = field_alias{"fneg", "", {}};
constexpr auto cneg_field = field_alias{"cneg", "", {}};

auto make_plr(const field_map& fields) -> plr
{
    auto result = plr{};
    result.init = get(fields, init_field);
    result.lam = get(fields, lam_field);
    result.turb = get(fields, turb_field);
    result.expt = get(fields, expt_field);
    return result;
}

auto make_dor(const field_map& fields) -> dor
{
    auto result = dor{};
    static_cast<plr&>(result) = make_plr(fields);
    result.dtmin = get(fields, dtmin_field);
    result.ht = get(fields, ht_field);
    result.wd = get(fields, wd_field);
    result.cd = get(fields, cd_field);
    return result;
}

auto make_element(element_type type, const field_map& fields,
                  const std::vector<fan_point>& points) -> element
{
    switch (type) {
    case element_type::plr:
        return make_plr(fields);
    case element_type::dwc:
        return make_dwc(get(fields, length_field),
                        get(fields, hdia_field),
                        get(fields, area_field),
                        get(fields, rough_field),
                        get(fields, tdlc_field),
                        get(fields, lflc_field),
                        get(fields, ldlc_field),
                        get(fields, linit_field));
    case element_type::qfr:
        return make_qfr(get(fields, a_field), get(fields, b_field));
    case element_type::dor:
        return make_dor(fields);
    case element_type::cfr:
        return cfr{get(fields, flow_field)};
    case element_type::fan:
        return make_fan(make_plr(fields),
                        get(fields, rdens_field),
                        get(fields, fdf_field),
                        get(fields, sop_field),
                        get(fields, off_field),
                        get(fields, mfl_field),
                        points,
                        get(fields, speed_field));
    case element_type::cpf:
        return make_cpf(get(fields, upo_field),
                        get(fields, prmin_field),
                        get(fields, ftyp_field));
    case element_type::ckv:
        return ckv{get(fields, dp0_field), get(fields, coef_field)};
    case element_type::prv:
        return make_prv(get(fields, fpos_field),
                        get(fields, cpos_field),
                        get(fields, fneg_field),
                        get(fields, cneg_field));
    }
    throw std::invalid_argument{"unknown element type"};
}

}

auto get(const field_map& fields, const field_alias& field) -> double
{
    if (const auto found = fields.find(field.name); found != fields.end()) {
        return found->second;
    }
    if (!field.alias.empty()) {
        if (const auto found = fields.find(field.alias);
            found != fields.end()) {
            return found->second;
        }
    }
    if (field.fallback) {
        return *field.fallback;
    }
    auto what = std::string{"missing required field "};
    what += field.name;
    if (!field.alias.empty()) {
        what += " (or ";
        what += field.alias;
        what += ")";
    }
    throw missing_argument{std::string{field.name}, what};
}

auto make_element(const element_record& r) -> element
{
    try {
        return make_element(r.type, r.fields, r.points);
    }
    catch (const missing_argument& ex) {
        throw missing_argument{
            ex.field,
            std::string{to_cstring(r.type)} + " element "
            + r.name.get() + ": " + ex.what()
        };
    }
}

auto operator<<(std::ostream& os, const record& value) -> std::ostream&
{
    std::visit(detail::overloaded{
        [&os](const title_record& r) {
            os << "title_record{.title=" << r.title << "}";
        },
        [&os](const node_record& r) {
            os << "node_record{.name=" << r.name;
            os << ",.type=" << r.type;
            os << ",.ht=" << r.ht;
            os << ",.temp=" << r.temp;
            if (r.pres) {
                os << ",.pres=" << *r.pres;
            }
            os << "}";
        },
        [&os](const element_record& r) {
            os << "element_record{.name=" << r.name;
            os << ",.type=" << r.type;
            os << ",.fields={";
            auto prefix = "";
            for (auto&& entry: r.fields) {
                os << prefix << entry.first << "=" << entry.second;
                prefix = ",";
            }
            os << "}";
            if (!r.points.empty()) {
                os << ",.points=" << r.points.size();
            }
            os << "}";
        },
        [&os](const link_record& r) {
            os << "link_record{.name=" << r.name;
            os << ",.node1=" << r.node1;
            os << ",.ht1=" << r.ht1;
            os << ",.node2=" << r.node2;
            os << ",.ht2=" << r.ht2;
            os << ",.element=" << r.element;
            if (r.wind) {
                os << ",.wind=" << *r.wind;
                os << ",.wpmod=" << r.wpmod;
            }
            os << "}";
        },
    }, value);
    return os;
}

}
