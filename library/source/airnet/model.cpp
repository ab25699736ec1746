#include <sstream> // for std::ostringstream
#include <utility> // for std::move
#include <variant> // for std::visit

#include "airnet/constants.hpp"
#include "airnet/errors.hpp"
#include "airnet/model.hpp"

namespace airnet {

namespace {

auto make_node(const node_record& r) -> node
{
    auto result = node{};
    result.name = r.name;
    result.variable = (r.type != 'c');
    result.height = r.ht;
    result.temperature = r.temp;
    result.pressure = r.pres.value_or(0.0);
    return result;
}

auto make_link(const link_record& r) -> link
{
    auto result = link{};
    result.name = r.name;
    result.node0 = r.node1;
    result.ht0 = r.ht1;
    result.node1 = r.node2;
    result.ht1 = r.ht2;
    result.element = r.element;
    result.wind = r.wind;
    result.wpmod = r.wpmod;
    return result;
}

auto unresolved(const link& l, const char* kind, const name& key)
    -> unresolved_reference
{
    std::ostringstream os;
    os << "link " << l.name << ": no " << kind << " named " << key;
    return unresolved_reference{l, os.str()};
}

auto get_node(const model& value, const link& l, const name& key)
    -> const node&
{
    if (const auto found = find_node(value, key)) {
        return *found;
    }
    throw unresolved(l, "node", key);
}

auto get_element(const model& value, const link& l) -> const element&
{
    if (const auto found = value.elements.find(l.element);
        found != value.elements.end()) {
        return found->second;
    }
    throw unresolved(l, "element", l.element);
}

auto scale(flow_result result, double mult) noexcept -> flow_result
{
    result.flow1 *= mult;
    result.flow2 *= mult;
    result.dflow1 *= mult;
    result.dflow2 *= mult;
    return result;
}

}

auto make_model(std::span<const record> records, std::ostream& diags)
    -> model
{
    auto result = model{};
    auto links = std::vector<const link_record*>{};
    for (auto&& r: records) {
        std::visit(detail::overloaded{
            [&result](const title_record& arg) {
                result.title = arg.title;
            },
            [&result,&diags](const node_record& arg) {
                const auto [it, inserted] =
                    result.nodes.insert_or_assign(arg.name, make_node(arg));
                if (!inserted) {
                    diags << "replaced node " << it->first << "\n";
                }
            },
            [&result,&diags](const element_record& arg) {
                const auto [it, inserted] = result.elements.insert_or_assign(
                    arg.name, make_element(arg));
                if (!inserted) {
                    diags << "replaced element " << it->first << "\n";
                }
            },
            [&links](const link_record& arg) {
                links.push_back(&arg);
            },
        }, r);
    }
    for (auto&& p: links) {
        auto l = make_link(*p);
        if (!result.nodes.contains(l.node0)) {
            throw unresolved(l, "node", l.node0);
        }
        if (!result.nodes.contains(l.node1)) {
            throw unresolved(l, "node", l.node1);
        }
        if (!result.elements.contains(l.element)) {
            throw unresolved(l, "element", l.element);
        }
        result.links.push_back(std::move(l));
    }
    for (auto&& entry: result.nodes) {
        if (entry.second.variable) {
            entry.second.index = size(result.variable_nodes);
            result.variable_nodes.push_back(entry.first);
        }
    }
    set_properties(result);
    return result;
}

auto size(const model& value) noexcept -> std::size_t
{
    return size(value.variable_nodes);
}

auto set_properties(model& value) noexcept -> void
{
    for (auto&& entry: value.nodes) {
        set_properties(entry.second);
    }
}

auto find_node(const model& value, const name& key) -> const node*
{
    const auto found = value.nodes.find(key);
    return (found != value.nodes.end())? &found->second: nullptr;
}

auto find_node(model& value, const name& key) -> node*
{
    const auto found = value.nodes.find(key);
    return (found != value.nodes.end())? &found->second: nullptr;
}

auto find_link(const model& value, const name& key) -> const link*
{
    for (auto&& l: value.links) {
        if (l.name == key) {
            return &l;
        }
    }
    return nullptr;
}

auto pressure_drop(const model& value, const link& l) -> double
{
    const auto& n0 = get_node(value, l, l.node0);
    const auto& n1 = get_node(value, l, l.node1);
    return (n0.pressure - n0.density * gravity * l.ht0)
         - (n1.pressure - n1.density * gravity * l.ht1);
}

auto calculate(const model& value, const link& l, double pdrop)
    -> flow_result
{
    const auto& e = get_element(value, l);
    const auto& n0 = get_node(value, l, l.node0);
    const auto& n1 = get_node(value, l, l.node1);
    return scale(calculate(e, n0, n1, pdrop), l.mult);
}

auto calculate(const model& value, const link& l) -> flow_result
{
    return calculate(value, l, pressure_drop(value, l));
}

auto linearize(const model& value, const link& l) -> double
{
    const auto& e = get_element(value, l);
    const auto& n0 = get_node(value, l, l.node0);
    const auto& n1 = get_node(value, l, l.node1);
    return l.mult * linearize(e, n0, n1);
}

auto summarize(std::ostream& os, const model& value) -> void
{
    os << "Title: " << value.title << "\n";
    os << "\n";
    os << "Elements:\n";
    os << "=========\n";
    auto counts = std::map<element_type, std::size_t>{};
    for (auto&& entry: value.elements) {
        ++counts[type_of(entry.second)];
    }
    for (auto&& entry: counts) {
        os << entry.first << ": " << entry.second << "\n";
    }
    os << "\n";
    os << "Nodes: " << size(value.nodes) << "\n";
    os << "\n";
    os << "Links: " << size(value.links) << "\n";
    os << "\n";
    const auto n = size(value);
    os << "System size: " << n << " x " << n << "\n";
}

}
