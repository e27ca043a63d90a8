#include <modules/graphics/effects/colorCache.hpp>

namespace {
    template<typename T>
    void captureColors(const WeakList<T>& elements, ColorMap<T>& colors) {
        for (const auto& entry : elements) {
            auto element = entry.lock();
            if (!element) continue;
            colors.emplace(entry, element->getColor());
        }
    }

    template<typename T>
    void restoreColors(const ColorMap<T>& colors) {
        for (const auto& [entry, color] : colors) {
            if (auto element = entry.lock()) {
                element->setColor(color);
            }
        }
    }

    template<typename T>
    void snapshotColors(const WeakList<T>& elements, vector<pair<weak_ptr<T>, Color>>& result) {
        result.reserve(elements.size());
        for (const auto& entry : elements) {
            if (auto element = entry.lock()) {
                result.emplace_back(entry, element->getColor());
            }
        }
    }

    template<typename T>
    std::optional<Color> findColor(const ColorMap<T>& colors, const shared_ptr<T>& element) {
        if (!element) return std::nullopt;
        auto it = colors.find(weak_ptr<T>(element));
        if (it == colors.end()) return std::nullopt;
        return it->second;
    }
}

ColorSnapshot ColorSnapshot::take(const BoundVisuals& visuals) {
    ColorSnapshot snapshot;
    snapshotColors(visuals.getImages(), snapshot.images);
    snapshotColors(visuals.getTexts(), snapshot.texts);
    return snapshot;
}

void ColorCache::capture(const BoundVisuals& visuals) {
    clear();
    captureColors(visuals.getImages(), imageColors);
    captureColors(visuals.getTexts(), textColors);
}

void ColorCache::restore() const {
    restoreColors(imageColors);
    restoreColors(textColors);
}

void ColorCache::clear() {
    imageColors.clear();
    textColors.clear();
}

std::optional<Color> ColorCache::getOriginal(const shared_ptr<ImageElement>& image) const {
    return findColor(imageColors, image);
}

std::optional<Color> ColorCache::getOriginal(const shared_ptr<Text>& text) const {
    return findColor(textColors, text);
}
