#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "contraption/app/host_options.hpp"

namespace {

bool parse(std::vector<std::string> args, HostOptions& options) {
    args.insert(args.begin(), "contraption");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return parseHostArgs(static_cast<int>(argv.size()), argv.data(), options);
}

} // namespace

TEST(HostOptionsTest, DefaultsDoNotPersistState) {
    HostOptions options;
    ASSERT_TRUE(parse({}, options));
    EXPECT_FALSE(options.persistState);
    EXPECT_EQ(options.windowWidth, SimulatorConstants::DefaultCanvasWidth);
    EXPECT_EQ(options.windowHeight, SimulatorConstants::DefaultCanvasHeight);
    EXPECT_FALSE(options.simConfig.chamberOrder.has_value());
}

TEST(HostOptionsTest, StateFlagLoadsAndSavesThatFile) {
    HostOptions options;
    ASSERT_TRUE(parse({"--state", "run.json"}, options));
    EXPECT_TRUE(options.persistState);
    EXPECT_EQ(options.statePath, "run.json");
}

TEST(HostOptionsTest, ParsesSeedChambersAndSize) {
    HostOptions options;
    ASSERT_TRUE(parse({"--seed", "42", "--chambers", "pegs,,bumper", "--size", "960x540"}, options));
    EXPECT_EQ(options.simConfig.seed, 42u);
    ASSERT_TRUE(options.simConfig.chamberOrder.has_value());
    EXPECT_EQ(*options.simConfig.chamberOrder, (std::vector<std::string>{"pegs", "bumper"}));
    EXPECT_EQ(options.windowWidth, 960u);
    EXPECT_EQ(options.windowHeight, 540u);
    EXPECT_FALSE(options.persistState);
}

TEST(HostOptionsTest, RejectsBadInput) {
    HostOptions options;
    EXPECT_FALSE(parse({"--size", "960"}, options));
    EXPECT_FALSE(parse({"--size", "0x540"}, options));
    EXPECT_FALSE(parse({"--seed", "many"}, options));
    EXPECT_FALSE(parse({"--state"}, options));
    EXPECT_FALSE(parse({"--verbose"}, options));
}
