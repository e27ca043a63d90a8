#ifndef COLOR_CACHE
#define COLOR_CACHE

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include "modules/graphics/utils/color.hpp"
#include "boundVisuals.hpp"

template<typename T>
using ColorMap = map<weak_ptr<T>, Color, owner_less<weak_ptr<T>>>;

// The colours bound visuals held when an animation started
struct ColorSnapshot {
    vector<pair<weak_ptr<ImageElement>, Color>> images;
    vector<pair<weak_ptr<Text>, Color>> texts;

    static ColorSnapshot take(const BoundVisuals& visuals);
};

/**
 * Original colour of every bound visual, the baseline the release animation and
 * deactivation return to. Rebuilt from scratch on every bind.
 */
class ColorCache {
public:
    // Clears the cache and records each bound element's current colour.
    // Within one pass the first colour seen for an element wins.
    void capture(const BoundVisuals& visuals);

    // Writes every cached colour back, skipping elements that no longer exist
    void restore() const;

    void clear();

    [[nodiscard]] std::optional<Color> getOriginal(const shared_ptr<ImageElement>& image) const;
    [[nodiscard]] std::optional<Color> getOriginal(const shared_ptr<Text>& text) const;

    [[nodiscard]] size_t size() const { return imageColors.size() + textColors.size(); }
    [[nodiscard]] const ColorMap<ImageElement>& getImageColors() const { return imageColors; }
    [[nodiscard]] const ColorMap<Text>& getTextColors() const { return textColors; }

private:
    ColorMap<ImageElement> imageColors;
    ColorMap<Text> textColors;
};

#endif
