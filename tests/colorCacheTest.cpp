#include <gtest/gtest.h>
#include "testScene.hpp"

TEST(ColorCache, CapturesCurrentColors) {
    TestScene scene;
    BoundVisuals visuals;
    visuals.bind(scene.root);

    ColorCache cache;
    cache.capture(visuals);

    EXPECT_EQ(cache.size(), 4u);
    EXPECT_EQ(cache.getOriginal(scene.badge), Color({1, 0, 0, 1}));
    EXPECT_EQ(cache.getOriginal(scene.label), scene.label->getColor());
}

TEST(ColorCache, CaptureReplacesThePreviousPass) {
    TestScene scene;
    BoundVisuals visuals;
    visuals.bind(scene.root);
    ColorCache cache;
    cache.capture(visuals);

    scene.icon->setColor({0.2f, 0.4f, 0.6f, 1.0f});
    visuals.bind(scene.root, {}, {scene.badge});
    cache.capture(visuals);

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.getOriginal(scene.badge).has_value());
    EXPECT_EQ(cache.getOriginal(scene.icon), Color({0.2f, 0.4f, 0.6f, 1.0f}));
}

TEST(ColorCache, RestoreSkipsDestroyedElements) {
    TestScene scene;
    BoundVisuals visuals;
    visuals.bind(scene.root);
    ColorCache cache;
    cache.capture(visuals);

    scene.icon->setColor({0, 0, 0, 1});
    scene.label->setColor({0, 0, 0, 1});
    erase(scene.root->children, static_pointer_cast<UIElement>(scene.badge));
    scene.badge.reset();
    cache.restore();

    EXPECT_EQ(scene.icon->getColor(), Color({1, 1, 1, 1}));
    EXPECT_EQ(scene.label->getColor(), Color({1, 1, 1, 1}));
}

TEST(ColorCache, SnapshotHoldsColorsAtTheTimeTaken) {
    TestScene scene;
    BoundVisuals visuals;
    visuals.bind(scene.root);

    scene.icon->setColor({0.5f, 0.5f, 0.5f, 1.0f});
    ColorSnapshot snapshot = ColorSnapshot::take(visuals);
    scene.icon->setColor({1, 1, 1, 1});

    ASSERT_EQ(snapshot.images.size(), 3u);
    ASSERT_EQ(snapshot.texts.size(), 1u);
    EXPECT_EQ(snapshot.images[0].first.lock(), scene.icon);
    EXPECT_EQ(snapshot.images[0].second, Color({0.5f, 0.5f, 0.5f, 1.0f}));
}
