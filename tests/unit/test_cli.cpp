#include <gtest/gtest.h>
#include "uplift/core/cli.hpp"
#include <string>
#include <vector>

using namespace uplift::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "uplift");
        storage = std::move(args);
        argv.clear();
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }
    
    CommandLineParser parser{"uplift"};
    std::vector<std::string> storage;
    std::vector<char*> argv;
};

TEST_F(CommandLineParserTest, LongOptions) {
    ASSERT_TRUE(parse({"--filename", "video.mp4", "--ratelimit=256", "--quiet"}));
    
    EXPECT_EQ(parser.get_option("filename"), "video.mp4");
    EXPECT_EQ(parser.get_option("ratelimit"), "256");
    EXPECT_TRUE(parser.has_option("quiet"));
    EXPECT_FALSE(parser.has_option("verbose"));
}

TEST_F(CommandLineParserTest, ShortOptions) {
    ASSERT_TRUE(parse({"-f", "video.mp4", "-t", "My Clip", "-qr512"}));
    
    EXPECT_EQ(parser.get_option("filename"), "video.mp4");
    EXPECT_EQ(parser.get_option("title"), "My Clip");
    EXPECT_TRUE(parser.has_option("quiet"));
    EXPECT_TRUE(parser.has_option("q"));
    EXPECT_EQ(parser.get_option("ratelimit"), "512");
}

TEST_F(CommandLineParserTest, DefaultsApplyWhenAbsent) {
    ASSERT_TRUE(parse({"--filename", "video.mp4"}));
    
    EXPECT_EQ(parser.get_option("title"), "Video Title");
    EXPECT_EQ(parser.get_option("description"), "uploaded by uplift");
    EXPECT_EQ(parser.get_option("config"), "~/.uplift.conf");
    EXPECT_FALSE(parser.has_option("title"));
    EXPECT_EQ(parser.get_option("tags"), "");
}

TEST_F(CommandLineParserTest, CamelCaseOptions) {
    ASSERT_TRUE(parse({"--categoryId", "22", "--metaJSON", "meta.json", "--tags", "a, b"}));
    
    EXPECT_EQ(parser.get_option("categoryId"), "22");
    EXPECT_EQ(parser.get_option("metaJSON"), "meta.json");
    EXPECT_EQ(parser.get_option("tags"), "a, b");
}

TEST_F(CommandLineParserTest, UnknownOption) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --bogus");
    
    EXPECT_FALSE(parse({"-z"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: -z");
}

TEST_F(CommandLineParserTest, MissingValue) {
    EXPECT_FALSE(parse({"--filename"}));
    EXPECT_EQ(parser.get_error(), "Option --filename requires a value");
}

TEST_F(CommandLineParserTest, StrayArgumentRejected) {
    EXPECT_FALSE(parse({"--filename", "video.mp4", "extra"}));
    EXPECT_EQ(parser.get_error(), "Unexpected argument: extra");
    EXPECT_FALSE(parser.has_option("filename"));

    EXPECT_FALSE(parse({"-"}));
    EXPECT_EQ(parser.get_error(), "Unexpected argument: -");
}

TEST_F(CommandLineParserTest, SwitchRejectsValue) {
    EXPECT_FALSE(parse({"--quiet=yes"}));
    EXPECT_EQ(parser.get_error(), "Option --quiet does not take a value");
}

TEST_F(CommandLineParserTest, ShortNameNotAcceptedAsLongOption) {
    EXPECT_FALSE(parse({"--q"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --q");
}

TEST_F(CommandLineParserTest, BundledSwitchesBeforeValue) {
    ASSERT_TRUE(parse({"-qf", "clip.mov"}));
    EXPECT_TRUE(parser.has_option("quiet"));
    EXPECT_EQ(parser.get_option("filename"), "clip.mov");

    EXPECT_FALSE(parse({"-qr"}));
    EXPECT_EQ(parser.get_error(), "Option -r requires a value");
}

TEST_F(CommandLineParserTest, ReparseStartsClean) {
    ASSERT_TRUE(parse({"--verbose", "--title", "First"}));
    ASSERT_TRUE(parse({"--filename", "video.mp4"}));

    EXPECT_FALSE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_option("title"), "Video Title");
}
