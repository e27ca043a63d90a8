#include <gtest/gtest.h>
#include <vector>
#include <modules/graphics/utils/animation.hpp>
#include <modules/utils/mathUtils.hpp>

TEST(Easing, EaseOutSineSpansZeroToOne) {
    EXPECT_FLOAT_EQ(easeOutSine(0), 0);
    EXPECT_FLOAT_EQ(easeOutSine(1), 1);
    EXPECT_FLOAT_EQ(easeOutSine(2), 1);
    EXPECT_GT(easeOutSine(0.5f), 0.5f);
}

TEST(Easing, PunchDecaysToZero) {
    EXPECT_FLOAT_EQ(punchOffset(0, 0.08f), 0);
    EXPECT_FLOAT_EQ(punchOffset(1, 0.08f), 0);
    EXPECT_GT(punchOffset(0.2f, 0.08f), 0);
    EXPECT_LT(punchOffset(0.7f, 0.08f), 0);
    EXPECT_LT(punchOffset(0.25f, 0.08f), 0.08f);
}

TEST(Animation, FeedsEasedProgressThenCompletesOnce) {
    std::vector<float> values;
    int completions = 0;
    Animation animation([&values](float t) { values.push_back(t); }, 0.1f,
                        [](float t) { return t * t; }, [&completions]() { completions++; });
    animation.start();

    animation.update(0.05f);
    animation.update(0.05f);
    animation.update(0.05f);

    ASSERT_EQ(values.size(), 1u);
    EXPECT_NEAR(values[0], 0.25f, 1e-5);
    EXPECT_EQ(completions, 1);
    EXPECT_TRUE(animation.completed);
}

TEST(Animation, ZeroDurationCompletesOnStart) {
    int completions = 0;
    Animation animation([](float) { FAIL(); }, 0.0f, nullptr, [&completions]() { completions++; });
    animation.start();
    EXPECT_TRUE(animation.completed);
    EXPECT_EQ(completions, 1);
}

TEST(Animation, CancelStopsUpdates) {
    int calls = 0;
    Animation animation([&calls](float) { calls++; }, 1.0f);
    animation.start();
    animation.update(0.1f);
    animation.cancel();
    animation.update(0.1f);
    EXPECT_EQ(calls, 1);
}
