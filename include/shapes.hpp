#pragma once

#include "particles.hpp"

// glyph bitmaps rasterized on the CPU only (no GPU atlas texture) so text can be sampled
// before a window exists and in headless tests, see loadGlyphFont
struct GlyphFont {
    Font font {};
    std::string path;
    int pixelSize = 0;

    bool loaded() const { return font.glyphs != nullptr && font.recs != nullptr; }
};

// where a character of the rasterized text ended up, in plane units
// offset is the byte offset of the character inside the original string
struct GlyphBox {
    int codepoint;
    int offset;
    int line;
    Eigen::AlignedBox2f box;
};

struct TextShape {
    std::vector<ShapeTarget> targets;
    std::vector<GlyphBox> glyphs;
    float fontSize = 0.0f;
    float lineHeight = 0.0f;
};

// false (and a warning) when the file is missing or not a font, the caller then gets empty shapes
bool loadGlyphFont(GlyphFont& font, const std::string& path, int pixelSize);
void unloadGlyphFont(GlyphFont& font);

// font size in plane units, grows with the smaller side of the plane and is clamped to [minFontSize, maxFontSize]
float responsiveFontSize(float width, float height);

// sampling step in raster pixels, small fonts sample densely so thin strokes still get particles
int sampleStride(float fontSize);

// draw text centered on the plane at rasterOversampling x resolution and keep every stride-th pixel
// whose alpha is over alphaThreshold, '\n' starts a new line, the font is (re)loaded at the needed size
// targets come back in raster scan order, shuffle them before assigning
TextShape rasterizeText(GlyphFont& font, const std::string& text, float width, float height, std::mt19937& rng);

// closest type color by summed absolute RGB difference
int nearestType(Color color);

// every imageSampleStride-th pixel with alpha over imageAlphaThreshold, stretched onto bounds (plane units)
// and colored with the nearest type, points outside the width x height plane are dropped
std::vector<ShapeTarget> sampleImageTargets(const Image& image, Rectangle bounds, float width, float height);

// hot air balloon: body tapering into a rope opening, two ropes, rounded basket
// points are in plane units relative to the balloon's bounding box center, height is its total height
std::vector<ShapeTarget> rasterizeBalloon(float height, std::mt19937& rng);
