#include <gtest/gtest.h>
#include <stdexcept>
#include <modules/graphics/utils/styleParser.hpp>

TEST(StyleParser, SplitsKeyValuePairs) {
    auto style = parseStyleString("width: 40px; tint:#ff8040 ;visible: false");
    EXPECT_EQ(style.size(), 3u);
    EXPECT_EQ(style["width"], "40px");
    EXPECT_EQ(style["tint"], "#ff8040");
    EXPECT_EQ(style["visible"], "false");
}

TEST(StyleParser, ParsesTimes) {
    EXPECT_FLOAT_EQ(parseTime("0.15s"), 0.15f);
    EXPECT_FLOAT_EQ(parseTime("150ms"), 0.15f);
    EXPECT_FLOAT_EQ(parseTime(" 0.1 "), 0.1f);
    EXPECT_THROW(parseTime("soon", "duration"), std::runtime_error);
}

TEST(StyleParser, RejectsTrailingGarbage) {
    EXPECT_FLOAT_EQ(parseNumber("0.95"), 0.95f);
    EXPECT_THROW(parseNumber("0.95x", "scale-amount"), std::runtime_error);
    EXPECT_THROW(parseNumber("", "scale-amount"), std::runtime_error);
}

TEST(StyleParser, ParsesColors) {
    EXPECT_EQ(parseColor("#ff0000"), Color({1, 0, 0, 1}));
    EXPECT_EQ(parseColor("#00000000"), Color({0, 0, 0, 0}));
    EXPECT_EQ(parseColor("rgba(255, 255, 0, 0)"), Color({1, 1, 0, 0}));
    EXPECT_EQ(parseColor("rgb(0, 255, 0)"), Color({0, 1, 0, 1}));
    EXPECT_EQ(parseColor("transparent"), Color({0, 0, 0, 0}));
    EXPECT_EQ(parseColor("nonsense"), Color());
}

TEST(StyleParser, ParsesScaleTransforms) {
    EXPECT_EQ(parseTransform("scale(0.5)"), sf::Vector3f(0.5f, 0.5f, 0.5f));
    EXPECT_EQ(parseTransform("scale(1, 0.5, 2)"), sf::Vector3f(1, 0.5f, 2));
    EXPECT_EQ(parseTransform("rotate(10)"), sf::Vector3f(1, 1, 1));
}
