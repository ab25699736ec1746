#include <gtest/gtest.h>

#include <sstream> // for std::istringstream, std::ostringstream
#include <string>

#include "airnet/constants.hpp"
#include "airnet/errors.hpp"
#include "airnet/model.hpp"
#include "airnet/properties.hpp"
#include "airnet/reader.hpp"

#include "networks.hpp"

using namespace airnet;

namespace {

auto read(const std::string& text) -> std::vector<record>
{
    std::istringstream is{text};
    return read_network(is);
}

auto make_pl2() -> model
{
    return make_model(read(test::afdata_pl2));
}

}

TEST(model, default_construction)
{
    const auto m = model{};
    EXPECT_TRUE(m.title.empty());
    EXPECT_TRUE(m.nodes.empty());
    EXPECT_TRUE(m.elements.empty());
    EXPECT_TRUE(m.links.empty());
    EXPECT_EQ(size(m), 0u);
}

TEST(make_model, empty)
{
    const auto m = make_model({});
    EXPECT_EQ(size(m), 0u);
    EXPECT_TRUE(m.variable_nodes.empty());
}

TEST(make_model, afdata_pl2)
{
    const auto m = make_pl2();
    EXPECT_EQ(m.title, "powerlaw test #2 input file");
    EXPECT_EQ(m.nodes.size(), 4u);
    EXPECT_EQ(m.links.size(), 3u);
    EXPECT_EQ(m.elements.size(), 7u);
    EXPECT_EQ(size(m), 2u);
    ASSERT_EQ(m.variable_nodes.size(), 2u);
    EXPECT_EQ(m.variable_nodes[0], name("node-2"));
    EXPECT_EQ(m.variable_nodes[1], name("node-3"));
    for (auto i = std::size_t{}; i < m.variable_nodes.size(); ++i) {
        const auto n = find_node(m, m.variable_nodes[i]);
        ASSERT_NE(n, nullptr);
        EXPECT_TRUE(n->variable);
        EXPECT_EQ(n->index, i);
    }
    const auto fixed = find_node(m, name("node-1"));
    ASSERT_NE(fixed, nullptr);
    EXPECT_FALSE(fixed->variable);
    EXPECT_FALSE(fixed->index);
}

TEST(make_model, links_refer_by_name)
{
    const auto m = make_pl2();
    const auto l = find_link(m, name("link-2"));
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->node0, name("node-2"));
    EXPECT_EQ(l->node1, name("node-3"));
    EXPECT_EQ(l->element, name("orf-0.0001"));
    EXPECT_EQ(l->mult, 1.0);
    EXPECT_EQ(find_link(m, name("link-4")), nullptr);
}

TEST(make_model, computes_properties_of_all_nodes)
{
    const auto m = make_pl2();
    for (auto&& entry: m.nodes) {
        const auto& n = entry.second;
        EXPECT_DOUBLE_EQ(n.density, air_density(n.temperature, n.pressure))
            << entry.first;
        EXPECT_GT(n.dvisc, 0.0) << entry.first;
    }
    const auto n4 = find_node(m, name("node-4"));
    ASSERT_NE(n4, nullptr);
    EXPECT_EQ(n4->pressure, -100.0);
    EXPECT_LT(n4->density, find_node(m, name("node-1"))->density);
}

TEST(make_model, links_before_nodes)
{
    const auto m = make_model(read(
        "link l1 a 0 b 0 e null\n"
        "element e plr 1e-6 1e-6 1e-3 0.5\n"
        "node a c 0 20 0\n"
        "node b v 0 20\n"
    ));
    EXPECT_EQ(m.links.size(), 1u);
    EXPECT_EQ(size(m), 1u);
}

TEST(make_model, unresolved_node)
{
    const auto records = read(
        "node a c 0 20 0\n"
        "element e plr 1e-6 1e-6 1e-3 0.5\n"
        "link l1 a 0 nowhere 0 e null\n"
    );
    try {
        make_model(records);
        FAIL() << "expected exception";
    }
    catch (const unresolved_reference& ex) {
        EXPECT_EQ(ex.value.name, name("l1"));
        EXPECT_NE(std::string{ex.what()}.find("nowhere"), std::string::npos);
    }
}

TEST(make_model, unresolved_element)
{
    const auto records = read(
        "node a c 0 20 0\n"
        "node b c 0 20 0\n"
        "link l1 a 0 b 0 nothing null\n"
    );
    EXPECT_THROW(make_model(records), unresolved_reference);
}

TEST(make_model, missing_element_field)
{
    auto r = element_record{};
    r.name = name("e");
    r.type = element_type::cfr;
    const auto records = std::vector<record>{r};
    EXPECT_THROW(make_model(records), missing_argument);
}

TEST(make_model, duplicates_replace_with_diagnostic)
{
    const auto records = read(
        "node a c 0 20 0\n"
        "node a v 0 30\n"
        "element e cfr 0.1\n"
        "element e cfr 0.2\n"
    );
    std::ostringstream diags;
    const auto m = make_model(records, diags);
    EXPECT_EQ(m.nodes.size(), 1u);
    EXPECT_TRUE(find_node(m, name("a"))->variable);
    EXPECT_EQ(std::get<cfr>(m.elements.at(name("e"))).flow, 0.2);
    EXPECT_EQ(diags.str(), "replaced node a\nreplaced element e\n");
}

TEST(make_model, non_fixed_types_are_variable)
{
    const auto m = make_model(read(
        "node a a 0 20 0\n"
        "node c c 0 20 0\n"
    ));
    EXPECT_TRUE(find_node(m, name("a"))->variable);
    EXPECT_FALSE(find_node(m, name("c"))->variable);
    EXPECT_EQ(size(m), 1u);
}

TEST(set_properties, model)
{
    auto m = make_pl2();
    auto n = find_node(m, name("node-2"));
    ASSERT_NE(n, nullptr);
    const auto before = n->density;
    n->temperature = 303.15;
    set_properties(m);
    EXPECT_LT(n->density, before);
    EXPECT_DOUBLE_EQ(n->density, air_density(303.15, 0.0));
}

TEST(pressure_drop, level)
{
    auto m = make_pl2();
    const auto& l = m.links[0];
    EXPECT_EQ(pressure_drop(m, l), 0.0);
    find_node(m, name("node-2"))->pressure = -10.0;
    set_properties(m);
    EXPECT_DOUBLE_EQ(pressure_drop(m, l), 10.0);
}

TEST(pressure_drop, heights)
{
    const auto m = make_model(read(
        "node a c 0 20 5\n"
        "node b c 0 0 -5\n"
        "element e plr 1e-6 1e-6 1e-3 0.5\n"
        "link l1 a 1.5 b 0.5 e null\n"
    ));
    const auto& a = m.nodes.at(name("a"));
    const auto& b = m.nodes.at(name("b"));
    const auto expected = (5.0 - a.density * gravity * 1.5)
                        - (-5.0 - b.density * gravity * 0.5);
    EXPECT_DOUBLE_EQ(pressure_drop(m, m.links[0]), expected);
}

TEST(calculate, link)
{
    auto m = make_pl2();
    const auto& l = m.links[0];
    EXPECT_EQ(calculate(m, l).flow1, 0.0);
    find_node(m, name("node-2"))->pressure = -10.0;
    set_properties(m);
    const auto result = calculate(m, l);
    const auto& e = m.elements.at(l.element);
    const auto expected = calculate(e, m.nodes.at(l.node0),
                                    m.nodes.at(l.node1), 10.0);
    EXPECT_EQ(result, expected);
    EXPECT_GT(result.flow1, 0.0);
    EXPECT_EQ(calculate(m, l, -10.0).flow1 < 0.0, true);
}

TEST(calculate, multiplier)
{
    const auto m = make_pl2();
    auto l = m.links[0];
    const auto single = calculate(m, l, 10.0);
    l.mult = 3.0;
    const auto triple = calculate(m, l, 10.0);
    EXPECT_DOUBLE_EQ(triple.flow1, 3.0 * single.flow1);
    EXPECT_DOUBLE_EQ(triple.dflow1, 3.0 * single.dflow1);
    EXPECT_DOUBLE_EQ(linearize(m, l), 3.0 * linearize(m, m.links[0]));
}

TEST(calculate, unresolved)
{
    const auto m = make_pl2();
    auto l = m.links[0];
    l.element = name("missing");
    EXPECT_THROW(calculate(m, l, 1.0), unresolved_reference);
    l = m.links[0];
    l.node1 = name("missing");
    EXPECT_THROW(pressure_drop(m, l), unresolved_reference);
}

TEST(linearize, link)
{
    const auto m = make_pl2();
    const auto& l = m.links[0];
    const auto& n0 = m.nodes.at(l.node0);
    const auto& n1 = m.nodes.at(l.node1);
    EXPECT_DOUBLE_EQ(linearize(m, l), 0.5 * 8.124e-09 * (n0.dvisc + n1.dvisc));
}

TEST(linearize, unimplemented)
{
    const auto m = make_model(read(
        "node a c 0 20 0\n"
        "node b c 0 20 0\n"
        "element e cfr 0.1\n"
        "link l1 a 0 b 0 e null\n"
    ));
    EXPECT_THROW(linearize(m, m.links[0]), unimplemented_law);
}

TEST(summarize, afdata_pl2)
{
    std::ostringstream os;
    summarize(os, make_pl2());
    const auto expected = std::string{
        "Title: powerlaw test #2 input file\n"
        "\n"
        "Elements:\n"
        "=========\n"
        "plr: 7\n"
        "\n"
        "Nodes: 4\n"
        "\n"
        "Links: 3\n"
        "\n"
        "System size: 2 x 2\n"
    };
    EXPECT_EQ(os.str(), expected);
}
