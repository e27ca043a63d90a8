#ifndef BOUND_VISUALS
#define BOUND_VISUALS

#include <memory>
#include <unordered_set>
#include <vector>
#include "modules/graphics/utils/UIElement.hpp"
#include "modules/graphics/components/image.hpp"
#include "modules/graphics/components/text.hpp"

using namespace std;

template<typename T>
using WeakList = vector<weak_ptr<T>>;

// Drops expired entries and repeats of an element, the first occurrence is kept
template<typename T>
void removeExpiredAndDuplicates(WeakList<T>& list) {
    unordered_set<const T*> seen;
    erase_if(list, [&seen](const weak_ptr<T>& entry) {
        auto element = entry.lock();
        return !element || !seen.insert(element.get()).second;
    });
}

/**
 * The image and text elements a press effect recolours. Elements are held weakly:
 * the scene owns them and any of them may be destroyed between binds, so every
 * access locks first and skips what has gone.
 */
class BoundVisuals {
public:
    // Collects every image and text under root (root and hidden elements included)
    // plus the explicitly included elements, then removes the excluded ones.
    // Binding an unchanged subtree again yields the same sets.
    void bind(const shared_ptr<UIElement>& root,
              const WeakList<UIElement>& include = {},
              const WeakList<UIElement>& exclude = {});

    [[nodiscard]] bool contains(const UIElement* element) const;
    [[nodiscard]] bool empty() const { return images.empty() && texts.empty(); }

    [[nodiscard]] const WeakList<ImageElement>& getImages() const { return images; }
    [[nodiscard]] const WeakList<Text>& getTexts() const { return texts; }

private:
    WeakList<ImageElement> images;
    WeakList<Text> texts;
};

#endif
