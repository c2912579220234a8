#pragma once

#include <latch/netrc.hpp>

#include <boost/leaf.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

namespace Latch::Tests
{
    class NetrcTests : public ::testing::Test
    {
      protected:
        std::string parseError(std::string const& text) const
        {
            return boost::leaf::try_handle_all(
                [&text]() -> boost::leaf::result<std::string> {
                    auto netrc = Netrc::fromString(text);
                    if (!netrc)
                        return netrc.error();
                    return std::string{};
                },
                [](std::string const& error) {
                    return error;
                },
                []() {
                    return std::string{"unknown error"};
                });
        }
    };

    TEST_F(NetrcTests, EmptyTextIsAnEmptyTable)
    {
        auto netrc = Netrc::fromString("");
        ASSERT_TRUE(netrc);
        EXPECT_TRUE(netrc.value().hosts.empty());
    }

    TEST_F(NetrcTests, ParsesMachinesOnOneLine)
    {
        auto netrc = Netrc::fromString("machine example.com login user password pass");
        ASSERT_TRUE(netrc);
        ASSERT_EQ(netrc.value().hosts.count("example.com"), 1u);
        EXPECT_EQ(netrc.value().hosts.at("example.com").login, "user");
        EXPECT_EQ(netrc.value().hosts.at("example.com").password, "pass");
    }

    TEST_F(NetrcTests, ParsesMultilineEntriesAndDefault)
    {
        auto netrc = Netrc::fromString(R"(
machine example.com
    login user
    password pass
    account acc

machine other.org login bob password builder port 8080
default
    login anonymous
    password guest
)");
        ASSERT_TRUE(netrc);
        auto const& hosts = netrc.value().hosts;
        ASSERT_EQ(hosts.size(), 3u);
        EXPECT_EQ(hosts.at("example.com").account, "acc");
        EXPECT_EQ(hosts.at("other.org").login, "bob");
        EXPECT_EQ(hosts.at("other.org").password, "builder");
        EXPECT_EQ(hosts.at("default").login, "anonymous");
        EXPECT_EQ(hosts.at("default").password, "guest");
    }

    TEST_F(NetrcTests, QuotedTokensMayBeEmptyOrContainSpaces)
    {
        auto netrc = Netrc::fromString(R"(machine example.com login "john doe" password "")"
                                       "\nmachine quoted.org login q password \"say \\\"hi\\\"\"");
        ASSERT_TRUE(netrc);
        auto const& hosts = netrc.value().hosts;
        EXPECT_EQ(hosts.at("example.com").login, "john doe");
        EXPECT_EQ(hosts.at("example.com").password, "");
        EXPECT_EQ(hosts.at("quoted.org").password, "say \"hi\"");
    }

    TEST_F(NetrcTests, CommentsAndMacrosAreSkipped)
    {
        auto netrc = Netrc::fromString(R"(# personal netrc
machine example.com login user password pass # trailing comment
macdef init
cd /pub
login ignored

machine after.org login after password macro
)");
        ASSERT_TRUE(netrc);
        auto const& hosts = netrc.value().hosts;
        ASSERT_EQ(hosts.size(), 2u);
        EXPECT_EQ(hosts.at("example.com").password, "pass");
        EXPECT_EQ(hosts.at("after.org").login, "after");
    }

    TEST_F(NetrcTests, FirstEntryForAMachineWins)
    {
        auto netrc = Netrc::fromString("machine example.com login first password one\n"
                                       "machine example.com login second password two\n");
        ASSERT_TRUE(netrc);
        EXPECT_EQ(netrc.value().hosts.at("example.com").login, "first");
    }

    TEST_F(NetrcTests, MissingValueIsAnError)
    {
        EXPECT_FALSE(Netrc::fromString("machine example.com login"));
        EXPECT_FALSE(Netrc::fromString("machine"));
        EXPECT_THAT(parseError("machine example.com\nlogin user\npassword"), ::testing::HasSubstr("line 3"));
    }

    TEST_F(NetrcTests, UnknownTokenIsAnError)
    {
        EXPECT_FALSE(Netrc::fromString("machine example.com login user passwd pass"));
        EXPECT_FALSE(Netrc::fromString("login user"));
    }
}
