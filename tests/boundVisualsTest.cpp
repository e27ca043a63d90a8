#include <gtest/gtest.h>
#include "testScene.hpp"

TEST(BoundVisuals, CollectsHostAndHiddenDescendants) {
    TestScene scene;
    auto tintedRoot = make_shared<ImageElement>(unordered_map<string, string>{{"key", "root"}});
    tintedRoot->children = {scene.root};

    BoundVisuals visuals;
    visuals.bind(tintedRoot);

    EXPECT_EQ(visuals.getImages().size(), 4u);
    EXPECT_TRUE(visuals.contains(tintedRoot.get()));
    EXPECT_TRUE(visuals.contains(scene.hiddenIcon.get()));
}

TEST(BoundVisuals, IncludedDuplicatesAreBoundOnce) {
    TestScene scene;
    BoundVisuals visuals;
    visuals.bind(scene.root, {scene.icon, scene.icon, scene.label});

    EXPECT_EQ(visuals.getImages().size(), 3u);
    EXPECT_EQ(visuals.getTexts().size(), 1u);
}

TEST(BoundVisuals, ExcludeWinsOverInclude) {
    TestScene scene;
    auto external = make_shared<Text>(unordered_map<string, string>{}, "External");
    BoundVisuals visuals;
    visuals.bind(scene.root, {external}, {external, scene.icon});

    EXPECT_FALSE(visuals.contains(external.get()));
    EXPECT_FALSE(visuals.contains(scene.icon.get()));
    EXPECT_EQ(visuals.getTexts().size(), 1u);
}

TEST(BoundVisuals, MissingRootBindsNothing) {
    BoundVisuals visuals;
    visuals.bind(nullptr);
    EXPECT_TRUE(visuals.empty());
}

TEST(BoundVisuals, ExpiredEntriesDropOutOfWeakLists) {
    TestScene scene;
    auto temporary = make_shared<ImageElement>(unordered_map<string, string>{});
    WeakList<UIElement> list = {scene.icon, temporary, scene.icon, scene.label};
    temporary.reset();

    removeExpiredAndDuplicates(list);

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].lock(), scene.icon);
    EXPECT_EQ(list[1].lock(), scene.label);
}
