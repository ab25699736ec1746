#include <gtest/gtest.h>

#include "airnet/cpf.hpp"

using namespace airnet;

namespace {

auto make_node(double temperature, double pressure = 0.0) -> node
{
    auto result = node{};
    result.temperature = temperature;
    result.pressure = pressure;
    set_properties(result);
    return result;
}

}

TEST(cpf, make_cpf)
{
    EXPECT_NO_THROW(make_cpf(50.0, 10.0, 0.1));
    EXPECT_THROW(make_cpf(50.0, 0.0, 0.1), std::invalid_argument);
    EXPECT_THROW(make_cpf(50.0, -1.0, 0.1), std::invalid_argument);
    EXPECT_THROW(make_cpf(-50.0, 10.0, 0.1), std::invalid_argument);
}

TEST(cpf, above_minimum_pressure_rise)
{
    const auto e = make_cpf(50.0, 10.0, 0.1);
    const auto n0 = make_node(293.15);
    const auto n1 = make_node(303.15);
    const auto result = calculate(e, n0, n1, -100.0);
    EXPECT_DOUBLE_EQ(result.flow1, n0.density * 50.0 / 100.0);
    EXPECT_DOUBLE_EQ(result.dflow1, result.flow1 / 100.0);
}

TEST(cpf, below_minimum_pressure_rise)
{
    const auto e = make_cpf(50.0, 10.0, 0.1);
    const auto n0 = make_node(293.15);
    const auto n1 = make_node(303.15);
    for (const auto pdrop: {-10.0, -5.0, 0.0, 20.0}) {
        const auto result = calculate(e, n0, n1, pdrop);
        EXPECT_DOUBLE_EQ(result.flow1, n0.density * 50.0 / 10.0);
        EXPECT_EQ(result.dflow1, 0.0);
    }
}

TEST(cpf, flow_falls_as_pressure_rise_grows)
{
    const auto e = make_cpf(50.0, 10.0, 0.1);
    const auto n = make_node(293.15);
    EXPECT_GT(calculate(e, n, n, -20.0).flow1, calculate(e, n, n, -40.0).flow1);
}

TEST(cpf, linearize)
{
    const auto n = node{};
    EXPECT_DOUBLE_EQ(linearize(make_cpf(50.0, 10.0, 0.1), n, n), 0.01);
}
