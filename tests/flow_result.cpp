#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "airnet/flow_result.hpp"

using namespace airnet;

TEST(flow_result, default_construction)
{
    constexpr auto result = flow_result{};
    static_assert(result.count == 1);
    static_assert(net_flow(result) == 0.0);
    EXPECT_EQ(result, flow_result{});
}

TEST(flow_result, net_flow)
{
    const auto result = flow_result{.count = 2, .flow1 = 0.5, .flow2 = -0.25};
    EXPECT_EQ(net_flow(result), 0.25);
}

TEST(flow_result, ostream_operator_support)
{
    {
        std::ostringstream os;
        os << flow_result{.flow1 = 0.5, .dflow1 = 0.1};
        EXPECT_EQ(os.str(), "flow_result{.count=1,.flow1=0.5,.dflow1=0.1}");
    }
    {
        std::ostringstream os;
        os << flow_result{.count = 2, .flow1 = 0.5, .flow2 = -0.25,
                          .dflow1 = 0.1, .dflow2 = 0.2};
        EXPECT_EQ(os.str(), "flow_result{.count=2,.flow1=0.5,.dflow1=0.1"
                            ",.flow2=-0.25,.dflow2=0.2}");
    }
}
