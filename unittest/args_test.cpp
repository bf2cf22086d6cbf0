#include "cdm/util/args.hpp"
#include "gtest/gtest.h"
#include <initializer_list>
#include <string>
#include <vector>

using cdm::invalid_option;
using cdm::is_opt;
using cdm::match_flag;
using cdm::match_value;

namespace {

// Owns a mutable, null terminated argument vector.
struct ArgsTest : ::testing::Test
{
protected:
    std::vector<std::string> storage;
    std::vector<char *> argv;

    auto make_args(std::initializer_list<const char *> args) -> char **
    {
        storage.assign(args.begin(), args.end());
        argv.clear();
        for (auto &arg : storage)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
        return argv.data();
    }
};

TEST(ArgsIsOptTest, dashPrefixedArguments)
{
    EXPECT_TRUE(is_opt("-m"));
    EXPECT_TRUE(is_opt("--model"));
    EXPECT_FALSE(is_opt("-"));
    EXPECT_FALSE(is_opt(""));
    EXPECT_FALSE(is_opt("LP64"));
}

TEST_F(ArgsTest, matchFlagConsumesExactSpelling)
{
    char **arg = make_args({"--table", "-h", "--bits"});

    EXPECT_TRUE(match_flag(arg, "", "--table"));
    EXPECT_EQ(argv.data() + 1, arg);

    EXPECT_FALSE(match_flag(arg, "", "--table"));
    EXPECT_TRUE(match_flag(arg, "-h", "--help"));
    EXPECT_EQ(argv.data() + 2, arg);
}

TEST_F(ArgsTest, matchFlagRejectsPrefixes)
{
    char **arg = make_args({"-hx", "--tables"});

    EXPECT_FALSE(match_flag(arg, "-h", "--help"));
    EXPECT_EQ(argv.data(), arg);

    ++arg;
    EXPECT_FALSE(match_flag(arg, "", "--table"));
    EXPECT_EQ(argv.data() + 1, arg);
}

TEST_F(ArgsTest, matchValueShortJoined)
{
    char **arg = make_args({"-mLP64"});
    EXPECT_EQ("LP64", match_value(arg, "-m", "--model"));
    EXPECT_EQ(nullptr, *arg);
}

TEST_F(ArgsTest, matchValueShortSeparate)
{
    char **arg = make_args({"-m", "LP64", "--bits"});
    EXPECT_EQ("LP64", match_value(arg, "-m", "--model"));
    EXPECT_EQ(argv.data() + 2, arg);
}

TEST_F(ArgsTest, matchValueLong)
{
    char **arg = make_args({"--model=LLP64"});
    EXPECT_EQ("LLP64", match_value(arg, "-m", "--model"));
    EXPECT_EQ(nullptr, *arg);

    arg = make_args({"--model", "SILP64"});
    EXPECT_EQ("SILP64", match_value(arg, "-m", "--model"));
    EXPECT_EQ(nullptr, *arg);
}

TEST_F(ArgsTest, matchValueOtherArgumentIsNotConsumed)
{
    char **arg = make_args({"--bits"});
    EXPECT_EQ(std::nullopt, match_value(arg, "-m", "--model"));
    EXPECT_EQ(argv.data(), arg);

    arg = make_args({"--models=LP64"});
    EXPECT_EQ(std::nullopt, match_value(arg, "-m", "--model"));
    EXPECT_EQ(argv.data(), arg);

    arg = make_args({"LP64"});
    EXPECT_EQ(std::nullopt, match_value(arg, "-m", "--model"));
    EXPECT_EQ(argv.data(), arg);
}

TEST_F(ArgsTest, matchValueMissingArgument)
{
    char **arg = make_args({"-m"});
    EXPECT_THROW(match_value(arg, "-m", "--model"), invalid_option);

    arg = make_args({"--model"});
    EXPECT_THROW(match_value(arg, "-m", "--model"), invalid_option);
}

TEST_F(ArgsTest, matchValueEmptyArgument)
{
    char **arg = make_args({"-m", ""});
    EXPECT_THROW(match_value(arg, "-m", "--model"), invalid_option);

    arg = make_args({"--model", ""});
    EXPECT_THROW(match_value(arg, "-m", "--model"), invalid_option);

    arg = make_args({"--model="});
    EXPECT_THROW(match_value(arg, "-m", "--model"), invalid_option);
}

} // namespace
