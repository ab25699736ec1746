#include <gtest/gtest.h>

#include <algorithm> // for std::count_if
#include <sstream> // for std::istringstream
#include <string>

#include "airnet/constants.hpp"
#include "airnet/errors.hpp"
#include "airnet/reader.hpp"

#include "networks.hpp"

using namespace airnet;

namespace {

auto read(const std::string& text) -> std::vector<record>
{
    std::istringstream is{text};
    return read_network(is);
}

template <class T>
auto count(const std::vector<record>& records) -> std::size_t
{
    return static_cast<std::size_t>(std::count_if(
        begin(records), end(records), [](const record& r){
            return std::holds_alternative<T>(r);
        }));
}

auto error_line(const std::string& text) -> std::size_t
{
    try {
        read(text);
    }
    catch (const bad_network_input& ex) {
        return ex.line;
    }
    return 0u;
}

}

TEST(read_network, empty)
{
    EXPECT_TRUE(read("").empty());
    EXPECT_TRUE(read("\n\n   \n").empty());
}

TEST(read_network, afdata_pl2)
{
    const auto records = read(test::afdata_pl2);
    EXPECT_EQ(records.size(), 15u);
    EXPECT_EQ(count<title_record>(records), 1u);
    EXPECT_EQ(count<node_record>(records), 4u);
    EXPECT_EQ(count<element_record>(records), 7u);
    EXPECT_EQ(count<link_record>(records), 3u);

    ASSERT_TRUE(std::holds_alternative<title_record>(records[0]));
    EXPECT_EQ(std::get<title_record>(records[0]).title,
              "powerlaw test #2 input file");

    ASSERT_TRUE(std::holds_alternative<node_record>(records[1]));
    const auto& n1 = std::get<node_record>(records[1]);
    EXPECT_EQ(n1.name, name("node-1"));
    EXPECT_EQ(n1.type, 'c');
    EXPECT_EQ(n1.ht, 0.0);
    EXPECT_DOUBLE_EQ(n1.temp, 20.0 + celsius_offset);
    EXPECT_EQ(n1.pres, 0.0);

    const auto& n2 = std::get<node_record>(records[2]);
    EXPECT_EQ(n2.type, 'v');
    EXPECT_FALSE(n2.pres);

    const auto& n4 = std::get<node_record>(records[4]);
    EXPECT_EQ(n4.pres, -100.0);

    ASSERT_TRUE(std::holds_alternative<element_record>(records[5]));
    const auto& e = std::get<element_record>(records[5]);
    EXPECT_EQ(e.name, name("orf-0.0001"));
    EXPECT_EQ(e.type, element_type::plr);
    EXPECT_EQ(e.fields.size(), 4u);
    EXPECT_EQ(e.fields.at("init"), 8.124e-09);
    EXPECT_EQ(e.fields.at("turb"), 8.48528e-05);
    EXPECT_EQ(e.fields.at("expt"), 0.5);

    ASSERT_TRUE(std::holds_alternative<link_record>(records[14]));
    const auto& l = std::get<link_record>(records[14]);
    EXPECT_EQ(l.name, name("link-3"));
    EXPECT_EQ(l.node1, name("node-3"));
    EXPECT_EQ(l.node2, name("node-4"));
    EXPECT_EQ(l.element, name("orf-0.0001"));
    EXPECT_FALSE(l.wind);
}

TEST(read_network, end_of_input)
{
    const auto records = read(
        "node a c 0 20 0\n"
        "*\n"
        "node b c 0 20 0\n"
    );
    EXPECT_EQ(records.size(), 1u);
}

TEST(read_network, comments_and_unknown_lines)
{
    const auto records = read(
        "! a comment\n"
        "something else entirely\n"
        "   title   Trimmed title   ! with comment\n"
        "node a v 1.5 0 ! trailing\n"
    );
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(std::get<title_record>(records[0]).title, "Trimmed title");
    const auto& n = std::get<node_record>(records[1]);
    EXPECT_EQ(n.ht, 1.5);
    EXPECT_DOUBLE_EQ(n.temp, celsius_offset);
}

TEST(read_network, second_title)
{
    EXPECT_EQ(error_line("title one\n\ntitle two\n"), 3u);
    EXPECT_THROW(read("title one\ntitle two\n"), bad_network_input);
}

TEST(read_network, bad_nodes)
{
    EXPECT_EQ(error_line("node a x 0 20 0\n"), 1u);
    EXPECT_EQ(error_line("\nnode a c 0 20\n"), 2u);
    EXPECT_EQ(error_line("node a v 0\n"), 1u);
    EXPECT_EQ(error_line("node a v zero 20\n"), 1u);
    EXPECT_EQ(error_line("node a v 0 20x\n"), 1u);
}

TEST(read_network, variable_node_with_pressure)
{
    const auto records = read("node a v 0 20 15\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<node_record>(records[0]).pres, 15.0);
}

TEST(read_network, duct)
{
    const auto records = read(
        "element d1 dwc 10.0 0.1 0.00785 0.0001\n"
        "\n"
        "   0.5 64 0 2e-7\n"
    );
    ASSERT_EQ(records.size(), 1u);
    const auto& e = std::get<element_record>(records[0]);
    EXPECT_EQ(e.type, element_type::dwc);
    EXPECT_EQ(e.fields.at("len"), 10.0);
    EXPECT_EQ(e.fields.at("rgh"), 0.0001);
    EXPECT_EQ(e.fields.at("lflc"), 64.0);
    EXPECT_EQ(e.fields.at("init"), 2e-7);
}

TEST(read_network, doorway)
{
    const auto records = read(
        "element door dor 0.008 0.008 0.85 0.5\n"
        "0.1 2.0 0.9 0.78\n"
    );
    ASSERT_EQ(records.size(), 1u);
    const auto& e = std::get<element_record>(records[0]);
    EXPECT_EQ(e.type, element_type::dor);
    EXPECT_EQ(e.fields.size(), 8u);
    EXPECT_EQ(e.fields.at("wd"), 0.9);
}

TEST(read_network, fan)
{
    const auto records = read(
        "element f1 fan 2.5e-7 2.5e-7 0.00085 0.5\n"
        "1.2 1.0 200 0.2 2 0.0\n"
        "200 -100 0 0 0.5\n"
        "350 -400 0 0 1.0\n"
        "link l1 a 0 b 0 f1 null\n"
    );
    ASSERT_EQ(records.size(), 2u);
    const auto& e = std::get<element_record>(records[0]);
    EXPECT_EQ(e.type, element_type::fan);
    EXPECT_EQ(e.fields.at("ltt"), 0.2);
    EXPECT_EQ(e.fields.count("nr"), 0u);
    ASSERT_EQ(e.points.size(), 2u);
    EXPECT_EQ(e.points[0], (fan_point{200.0, -100.0, 0.0, 0.0, 0.5}));
    EXPECT_EQ(e.points[1], (fan_point{350.0, -400.0, 0.0, 0.0, 1.0}));
    EXPECT_TRUE(std::holds_alternative<link_record>(records[1]));
}

TEST(read_network, single_line_elements)
{
    const auto records = read(
        "element e1 cfr 0.1\n"
        "element e2 cpf 50 10 0.1\n"
        "element e3 qfr 0.5 2\n"
        "element e4 ckv 5 0.01\n"
        "element e5 prv 0.1 10 0.05 20\n"
    );
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(std::get<element_record>(records[0]).fields.at("flow"), 0.1);
    EXPECT_EQ(std::get<element_record>(records[1]).fields.at("ftyp"), 0.1);
    EXPECT_EQ(std::get<element_record>(records[2]).fields.at("b"), 2.0);
    EXPECT_EQ(std::get<element_record>(records[3]).fields.at("coeff"), 0.01);
    EXPECT_EQ(std::get<element_record>(records[4]).fields.at("cneg"), 20.0);
}

TEST(read_network, bad_elements)
{
    EXPECT_EQ(error_line("element e1 xyz 1 2 3\n"), 1u);
    EXPECT_EQ(error_line("element e1 plr 1 2 3\n"), 1u);
    EXPECT_EQ(error_line("element e1 qfr 1 b\n"), 1u);
    EXPECT_EQ(error_line("element d1 dwc 10.0 0.1 0.00785 0.0001\n"), 1u);
    EXPECT_EQ(error_line("element d1 dwc 10.0 0.1 0.00785 0.0001\n"
                         "0.5 64 0\n"), 2u);
    EXPECT_EQ(error_line("element d1 dwc 10.0 0.1 0.00785 0.0001\n"
                         "*\n"), 2u);
    EXPECT_EQ(error_line("element f1 fan 2.5e-7 2.5e-7 0.00085 0.5\n"
                         "1.2 1.0 200 0.2 -1 0.0\n"), 2u);
    EXPECT_EQ(error_line("element f1 fan 2.5e-7 2.5e-7 0.00085 0.5\n"
                         "1.2 1.0 200 0.2 2 0.0\n"
                         "200 -100 0 0 0.5\n"), 3u);
}

TEST(read_network, links)
{
    const auto records = read(
        "link l1 a 1.0 b 2.0 e null\n"
        "link l2 a 0 b 0 e north 0.8\n"
    );
    ASSERT_EQ(records.size(), 2u);
    const auto& l1 = std::get<link_record>(records[0]);
    EXPECT_EQ(l1.ht1, 1.0);
    EXPECT_EQ(l1.ht2, 2.0);
    EXPECT_FALSE(l1.wind);
    const auto& l2 = std::get<link_record>(records[1]);
    EXPECT_EQ(l2.wind, "north");
    EXPECT_EQ(l2.wpmod, 0.8);
}

TEST(read_network, bad_links)
{
    EXPECT_EQ(error_line("link l1 a 0 b 0 e\n"), 1u);
    EXPECT_EQ(error_line("\n\nlink l1 a 0 b 0 e north\n"), 3u);
    EXPECT_EQ(error_line("link l1 a x b 0 e null\n"), 1u);
}
