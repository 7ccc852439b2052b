#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "contraption/core/state_io.hpp"

TEST(StateIOTest, ReadersFallBackOnMissingOrMistyped) {
    nlohmann::json j = {
        {"d", 1.5}, {"i", 3}, {"u", 42u}, {"neg", -1}, {"b", true}, {"s", "hi"}
    };

    EXPECT_DOUBLE_EQ(StateIO::readDouble(j, "d", 0.0), 1.5);
    EXPECT_DOUBLE_EQ(StateIO::readDouble(j, "i", 0.0), 3.0);
    EXPECT_DOUBLE_EQ(StateIO::readDouble(j, "s", 9.0), 9.0);
    EXPECT_DOUBLE_EQ(StateIO::readDouble(j, "missing", 9.0), 9.0);

    EXPECT_EQ(StateIO::readInt(j, "i", 0), 3);
    EXPECT_EQ(StateIO::readInt(j, "d", 7), 7);

    EXPECT_EQ(StateIO::readUInt(j, "u", 0), 42u);
    EXPECT_EQ(StateIO::readUInt(j, "neg", 5), 5u);

    EXPECT_TRUE(StateIO::readBool(j, "b", false));
    EXPECT_FALSE(StateIO::readBool(j, "i", false));

    EXPECT_EQ(StateIO::readString(j, "s", ""), "hi");
    EXPECT_EQ(StateIO::readString(j, "d", "x"), "x");

    // Not an object at all
    nlohmann::json arr = nlohmann::json::array({1, 2});
    EXPECT_DOUBLE_EQ(StateIO::readDouble(arr, "d", 4.0), 4.0);
}

TEST(StateIOTest, ColorsClampAndValidate) {
    Components::Color fallback(1, 2, 3);

    nlohmann::json j = {
        {"ok", StateIO::writeColor(Components::Color(10, 20, 30))},
        {"wide", {300, -5, 128}},
        {"short", {1, 2}},
        {"text", {"a", "b", "c"}}
    };

    EXPECT_EQ(StateIO::readColor(j, "ok", fallback), Components::Color(10, 20, 30));
    EXPECT_EQ(StateIO::readColor(j, "wide", fallback), Components::Color(255, 0, 128));
    EXPECT_EQ(StateIO::readColor(j, "short", fallback), fallback);
    EXPECT_EQ(StateIO::readColor(j, "text", fallback), fallback);
}

TEST(StateIOTest, ReadListKeepsOldValuesWhenAbsent) {
    std::vector<int> values{1, 2, 3};
    auto reader = [](const nlohmann::json& e) { return StateIO::readInt(e, "v", 0); };

    StateIO::readList(nlohmann::json::object(), "items", values, reader);
    EXPECT_EQ(values.size(), 3u);

    nlohmann::json j = {{"items", nlohmann::json::array({{{"v", 9}}, "junk", {{"v", 8}}})}};
    StateIO::readList(j, "items", values, reader);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], 9);
    EXPECT_EQ(values[1], 8);
}

TEST(StateIOTest, FileRoundTripAndBadInput) {
    const std::string path = "state_io_test_snapshot.json";
    nlohmann::json state = {{"t", 1.25}, {"balls", nlohmann::json::array()}};

    ASSERT_TRUE(StateIO::writeFile(path, state));
    auto loaded = StateIO::readFile(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, state);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(StateIO::readFile(path).has_value());
    std::remove(path.c_str());

    EXPECT_FALSE(StateIO::readFile("does_not_exist_contraption.json").has_value());
}
