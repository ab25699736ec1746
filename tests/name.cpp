#include <gtest/gtest.h>

#include <map>
#include <sstream> // for std::ostringstream
#include <string>
#include <utility> // for std::move

#include "airnet/name.hpp"

using namespace airnet;

TEST(name, default_construction)
{
    EXPECT_NO_THROW(name());
    EXPECT_TRUE(name().get().empty());
}

TEST(name, construction)
{
    EXPECT_NO_THROW(name("node-1"));
    EXPECT_NO_THROW(name("orf-0.0001"));
    EXPECT_NO_THROW(name(std::string{"link_3"}));
    EXPECT_NO_THROW(name(std::string_view{"x"}));
    EXPECT_EQ(name("node-1").get(), "node-1");

    EXPECT_THROW(name(""), std::invalid_argument);
    EXPECT_THROW(name("two words"), bad_name);
    EXPECT_THROW(name("tab\there"), bad_name);
    EXPECT_THROW(name("line\n"), bad_name);
    EXPECT_THROW(name("note!"), bad_name);
}

TEST(name, exception)
{
    try {
        name("bad name");
        FAIL() << "expected exception";
    }
    catch (const bad_name& ex) {
        EXPECT_EQ(ex.badchar(), ' ');
        EXPECT_EQ(ex.position(), 3u);
        EXPECT_EQ(std::string{ex.what()},
                  "name may not contain a space (at offset 3)");
    }
}

TEST(name, comment_character_message)
{
    try {
        name("note!");
        FAIL() << "expected exception";
    }
    catch (const bad_name& ex) {
        EXPECT_EQ(ex.badchar(), '!');
        EXPECT_EQ(ex.position(), 4u);
        EXPECT_EQ(std::string{ex.what()},
                  "name may not contain '!' (at offset 4)");
    }
}

TEST(name, equality)
{
    EXPECT_EQ(name("a"), name("a"));
    EXPECT_NE(name("a"), name("b"));
    EXPECT_NE(name(), name("a"));
    EXPECT_TRUE(name("a") == std::string{"a"});
}

TEST(name, ordering)
{
    EXPECT_TRUE(name("a") < name("b"));
    EXPECT_FALSE(name("b") < name("a"));
    auto map = std::map<name, int>{};
    map[name("node-3")] = 3;
    map[name("node-2")] = 2;
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.begin()->first, name("node-2"));
}

TEST(name, move_leaves_default)
{
    auto a = name("node-1");
    const auto b = std::move(a);
    EXPECT_EQ(b, name("node-1"));
    EXPECT_TRUE(a.get().empty()); // NOLINT(bugprone-use-after-move)
}

TEST(name, ostream_operator_support)
{
    std::ostringstream os;
    os << name("test");
    EXPECT_EQ(os.str(), "test");
}
