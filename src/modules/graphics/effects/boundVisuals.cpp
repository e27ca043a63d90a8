#include <modules/graphics/effects/boundVisuals.hpp>

namespace {
    template<typename T>
    void collectBound(const shared_ptr<UIElement>& root, const WeakList<UIElement>& include,
                      const unordered_set<const UIElement*>& excluded, WeakList<T>& result) {
        vector<shared_ptr<T>> found;
        collectElements(root, found);
        for (const auto& extra : include) {
            if (auto element = dynamic_pointer_cast<T>(extra.lock())) {
                found.push_back(element);
            }
        }

        result.clear();
        unordered_set<const UIElement*> seen;
        for (const auto& element : found) {
            if (!element || excluded.contains(element.get())) continue;
            if (!seen.insert(element.get()).second) continue;
            result.push_back(element);
        }
    }

    template<typename T>
    bool containsElement(const WeakList<T>& list, const UIElement* element) {
        for (const auto& entry : list) {
            auto bound = entry.lock();
            if (bound && bound.get() == element) return true;
        }
        return false;
    }
}

void BoundVisuals::bind(const shared_ptr<UIElement>& root,
                        const WeakList<UIElement>& include,
                        const WeakList<UIElement>& exclude) {
    unordered_set<const UIElement*> excluded;
    for (const auto& entry : exclude) {
        if (auto element = entry.lock()) {
            excluded.insert(element.get());
        }
    }

    collectBound(root, include, excluded, images);
    collectBound(root, include, excluded, texts);
}

bool BoundVisuals::contains(const UIElement* element) const {
    if (element == nullptr) return false;
    return containsElement(images, element) || containsElement(texts, element);
}
