// Google Test for command line parsing
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/MazeConfig.hpp"

static bool Parse(std::vector<const char*> args, MazeConfig& cfg, std::string& err) {
    args.insert(args.begin(), "perfectmaze");
    return ParseArgs((int)args.size(), args.data(), cfg, err);
}

TEST(MazeConfig, DefaultsWithoutArguments) {
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({}, cfg, err));
    EXPECT_EQ(cfg.width, 10);
    EXPECT_EQ(cfg.height, 10);
    EXPECT_TRUE(cfg.stepwise);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_EQ(cfg.stepDelayMs, 25);
    EXPECT_FALSE(cfg.console);
    EXPECT_FALSE(cfg.solve);
    EXPECT_FALSE(cfg.showHelp);
    EXPECT_TRUE(err.empty());
}

TEST(MazeConfig, AllOptions) {
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "-w", "12", "--height", "7", "--instant", "--seed", "42",
                        "--delay", "0", "--console", "--solve" }, cfg, err)) << err;
    EXPECT_EQ(cfg.width, 12);
    EXPECT_EQ(cfg.height, 7);
    EXPECT_FALSE(cfg.stepwise);
    EXPECT_EQ(cfg.seed, std::optional<uint32_t>(42));
    EXPECT_EQ(cfg.stepDelayMs, 0);
    EXPECT_TRUE(cfg.console);
    EXPECT_TRUE(cfg.solve);
}

TEST(MazeConfig, LastModeFlagWins) {
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--instant", "--stepwise" }, cfg, err));
    EXPECT_TRUE(cfg.stepwise);
}

TEST(MazeConfig, DimensionsAreLeftToTheGrid) {
    // out-of-range sizes parse; Grid rejects them later
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--width", "0", "--height", "-3" }, cfg, err));
    EXPECT_EQ(cfg.width, 0);
    EXPECT_EQ(cfg.height, -3);
}

TEST(MazeConfig, Help) {
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--help" }, cfg, err));
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_NE(Usage("perfectmaze").find("--width"), std::string::npos);
}

TEST(MazeConfig, ShortHelpIsNotHeight) {
    MazeConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "-h" }, cfg, err)) << err;
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_EQ(cfg.height, 10);

    ASSERT_TRUE(Parse({ "-H", "6" }, cfg, err)) << err;
    EXPECT_EQ(cfg.height, 6);
    EXPECT_FALSE(cfg.showHelp);
}

TEST(MazeConfig, UnknownOption) {
    MazeConfig cfg;
    cfg.width = 17;
    std::string err;
    EXPECT_FALSE(Parse({ "--width", "8", "--bogus" }, cfg, err));
    EXPECT_EQ(err, "unknown option: --bogus");
    EXPECT_EQ(cfg.width, 17); // untouched on failure
}

TEST(MazeConfig, BadNumbers) {
    MazeConfig cfg;
    std::string err;
    EXPECT_FALSE(Parse({ "--width", "ten" }, cfg, err));
    EXPECT_EQ(err, "invalid value for --width: 'ten'");

    EXPECT_FALSE(Parse({ "--seed", "-1" }, cfg, err));
    EXPECT_FALSE(Parse({ "--delay", "10001" }, cfg, err));
    EXPECT_FALSE(Parse({ "-H", "5x" }, cfg, err));
    EXPECT_FALSE(Parse({ "--width", "99999999999" }, cfg, err));
}

TEST(MazeConfig, MissingValue) {
    MazeConfig cfg;
    std::string err;
    EXPECT_FALSE(Parse({ "--seed" }, cfg, err));
    EXPECT_EQ(err, "--seed needs a value");
}
