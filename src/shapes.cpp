#include "shapes.hpp"

bool loadGlyphFont(GlyphFont& font, const std::string& path, int pixelSize)
{
    unloadGlyphFont(font);
    font.path = path;

    int dataSize = 0;
    unsigned char* fileData = LoadFileData(path.c_str(), &dataSize);
    if (fileData == nullptr) {
        TraceLog(LOG_WARNING, "HERO: Failed to read font file [%s]", path.c_str());
        return false;
    }

    // nullptr codepoints + 95 = the printable ASCII range, which is all the messages use
    GlyphInfo* glyphs = LoadFontData(fileData, dataSize, pixelSize, nullptr, 95, FONT_DEFAULT);
    UnloadFileData(fileData);
    if (glyphs == nullptr) {
        TraceLog(LOG_WARNING, "HERO: Failed to rasterize glyphs from [%s]", path.c_str());
        return false;
    }

    font.font.baseSize = pixelSize;
    font.font.glyphCount = 95;
    font.font.glyphPadding = 4;
    font.font.glyphs = glyphs;

    // the atlas is only needed for its GRAY_ALPHA conversion: LoadFontData hands out GRAYSCALE
    // glyphs which would turn into opaque boxes once drawn onto an RGBA image, so every glyph
    // is swapped for its alpha carrying copy out of the atlas (same trick LoadFontEx does)
    Image atlas = GenImageFontAtlas(glyphs, &font.font.recs, font.font.glyphCount, pixelSize, font.font.glyphPadding, 0);
    if (atlas.data == nullptr || font.font.recs == nullptr) {
        TraceLog(LOG_WARNING, "HERO: Failed to pack glyph atlas for [%s]", path.c_str());
        UnloadImage(atlas);
        unloadGlyphFont(font);
        return false;
    }
    for (int i = 0; i < font.font.glyphCount; i++) {
        UnloadImage(font.font.glyphs[i].image);
        font.font.glyphs[i].image = ImageFromImage(atlas, font.font.recs[i]);
    }
    UnloadImage(atlas);

    font.pixelSize = pixelSize;
    TraceLog(LOG_DEBUG, "HERO: Loaded [%s] at %dpx", path.c_str(), pixelSize);
    return true;
}

void unloadGlyphFont(GlyphFont& font)
{
    if (font.font.glyphs != nullptr)
        UnloadFontData(font.font.glyphs, font.font.glyphCount);
    if (font.font.recs != nullptr)
        MemFree(font.font.recs);
    font.font = Font {};
    font.pixelSize = 0;
}

float responsiveFontSize(float width, float height)
{
    const float size = std::min(width, height) * fontSizeFactor;
    return std::min(maxFontSize, std::max(minFontSize, size));
}

int sampleStride(float fontSize)
{
    // ~32 raster pixels of font per sample step, never below 2 so big screens don't explode the count
    return std::max(2, static_cast<int>(std::round(fontSize * rasterOversampling / 32.0f)));
}

static std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::string::size_type begin = 0;
    while (true) {
        const std::string::size_type end = text.find('\n', begin);
        lines.push_back(text.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
        if (end == std::string::npos)
            break;
        begin = end + 1;
    }
    return lines;
}

static float glyphAdvance(const Font& font, int index)
{
    // same rule raylib's DrawTextEx uses, some fonts leave advanceX at 0 and only fill the rectangle
    return font.glyphs[index].advanceX != 0 ? static_cast<float>(font.glyphs[index].advanceX) : font.recs[index].width;
}

static float measureLine(const Font& font, const std::string& line)
{
    float width = 0.0f;
    for (int i = 0; i < static_cast<int>(line.size());) {
        int bytes = 0;
        const int codepoint = GetCodepointNext(&line[i], &bytes);
        width += glyphAdvance(font, GetGlyphIndex(font, codepoint));
        i += std::max(bytes, 1);
    }
    return width;
}

// one line of text into a fresh RGBA image, glyphs are blitted at their bearing offsets
static Image renderLine(const Font& font, const std::string& line)
{
    const int width = std::max(1, static_cast<int>(std::ceil(measureLine(font, line))));
    Image image = GenImageColor(width, font.baseSize, BLANK);

    float penX = 0.0f;
    for (int i = 0; i < static_cast<int>(line.size());) {
        int bytes = 0;
        const int codepoint = GetCodepointNext(&line[i], &bytes);
        const int index = GetGlyphIndex(font, codepoint);
        const GlyphInfo& glyph = font.glyphs[index];
        if (codepoint != ' ' && codepoint != '\t' && glyph.image.data != nullptr) {
            const Rectangle source { 0.0f, 0.0f, static_cast<float>(glyph.image.width), static_cast<float>(glyph.image.height) };
            const Rectangle destination { penX + glyph.offsetX, static_cast<float>(glyph.offsetY), source.width, source.height };
            ImageDraw(&image, glyph.image, source, destination, WHITE);
        }
        penX += glyphAdvance(font, index);
        i += std::max(bytes, 1);
    }
    return image;
}

// keep every stride-th pixel with enough alpha, pixel (px, py) lands at origin + (px, py) * scale
static void sampleImage(Image& image, int stride, const Eigen::Vector2f& origin, float scale, std::mt19937& rng,
    std::vector<ShapeTarget>& out)
{
    ImageFormat(&image, PIXELFORMAT_UNCOMPRESSED_R8G8B8A8);
    const Color* pixels = static_cast<const Color*>(image.data);
    if (pixels == nullptr)
        return;

    std::uniform_int_distribution<int> randomType(0, numTypes - 1);
    for (int py = 0; py < image.height; py += stride) {
        for (int px = 0; px < image.width; px += stride) {
            if (pixels[py * image.width + px].a > alphaThreshold)
                out.push_back({ origin.x() + px * scale, origin.y() + py * scale, randomType(rng) });
        }
    }
}

TextShape rasterizeText(GlyphFont& font, const std::string& text, float width, float height, std::mt19937& rng)
{
    TextShape shape;
    if (width <= 0.0f || height <= 0.0f || text.empty())
        return shape;

    float fontSize = responsiveFontSize(width, height);
    const int pixelSize = static_cast<int>(std::round(fontSize * rasterOversampling));
    if (font.pixelSize != pixelSize && !loadGlyphFont(font, font.path, pixelSize))
        return shape;

    const std::vector<std::string> lines = splitLines(text);

    // shrink to fit the widest line, rendering happens at the loaded size and gets resized after
    float widest = 0.0f;
    for (const std::string& line : lines)
        widest = std::max(widest, measureLine(font.font, line) / rasterOversampling);
    float fit = 1.0f;
    if (widest > width * maxTextWidthFraction)
        fit = width * maxTextWidthFraction / widest;
    fontSize *= fit;

    shape.fontSize = fontSize;
    shape.lineHeight = fontSize * lineHeightFactor;
    const float totalHeight = shape.lineHeight * lines.size();
    const float startY = height * 0.5f - totalHeight * 0.5f;
    // raster pixel -> plane unit
    const float scale = fit / rasterOversampling;
    const int stride = sampleStride(fontSize);

    int lineOffset = 0;
    for (int lineIndex = 0; lineIndex < static_cast<int>(lines.size()); lineIndex++) {
        const std::string& line = lines[lineIndex];
        Image image = renderLine(font.font, line);
        if (fit < 1.0f) {
            const int scaledWidth = std::max(1, static_cast<int>(std::round(image.width * fit)));
            const int scaledHeight = std::max(1, static_cast<int>(std::round(image.height * fit)));
            ImageResize(&image, scaledWidth, scaledHeight);
        }

        const float lineWidth = measureLine(font.font, line) * scale;
        const float lineTop = startY + lineIndex * shape.lineHeight + (shape.lineHeight - fontSize) * 0.5f;
        const Eigen::Vector2f origin(width * 0.5f - lineWidth * 0.5f, lineTop);
        sampleImage(image, stride, origin, 1.0f / rasterOversampling, rng, shape.targets);
        UnloadImage(image);

        // character cells, the balloon uses them to know where a given letter sits
        float penX = origin.x();
        for (int i = 0; i < static_cast<int>(line.size());) {
            int bytes = 0;
            const int codepoint = GetCodepointNext(&line[i], &bytes);
            const float advance = glyphAdvance(font.font, GetGlyphIndex(font.font, codepoint)) * scale;
            GlyphBox glyph { codepoint, lineOffset + i, lineIndex,
                Eigen::AlignedBox2f(Eigen::Vector2f(penX, lineTop), Eigen::Vector2f(penX + advance, lineTop + fontSize)) };
            shape.glyphs.push_back(glyph);
            penX += advance;
            i += std::max(bytes, 1);
        }
        lineOffset += static_cast<int>(line.size()) + 1;
    }

    // whatever fell outside the plane (tiny windows, tall multi-line text) can't be reached anyway
    shape.targets.erase(std::remove_if(shape.targets.begin(), shape.targets.end(),
                            [&](const ShapeTarget& target) {
                                return target.x < 0.0f || target.y < 0.0f || target.x >= width || target.y >= height;
                            }),
        shape.targets.end());
    return shape;
}

int nearestType(Color color)
{
    int closest = 0;
    int closestDistance = std::numeric_limits<int>::max();
    for (int type = 0; type < numTypes; type++) {
        const Color& candidate = typeColors[type];
        const int distance = std::abs(color.r - candidate.r) + std::abs(color.g - candidate.g) + std::abs(color.b - candidate.b);
        if (distance < closestDistance) {
            closestDistance = distance;
            closest = type;
        }
    }
    return closest;
}

std::vector<ShapeTarget> sampleImageTargets(const Image& image, Rectangle bounds, float width, float height)
{
    std::vector<ShapeTarget> targets;
    if (image.data == nullptr || image.width <= 0 || image.height <= 0)
        return targets;

    // any pixel format, LoadImageColors converts to RGBA8
    Color* pixels = LoadImageColors(image);
    if (pixels == nullptr)
        return targets;

    const float scaleX = bounds.width / image.width;
    const float scaleY = bounds.height / image.height;
    for (int py = 0; py < image.height; py += imageSampleStride) {
        for (int px = 0; px < image.width; px += imageSampleStride) {
            const Color& pixel = pixels[py * image.width + px];
            if (pixel.a <= imageAlphaThreshold)
                continue;
            const float x = bounds.x + px * scaleX;
            const float y = bounds.y + py * scaleY;
            if (x < 0.0f || y < 0.0f || x >= width || y >= height)
                continue;
            targets.push_back({ x, y, nearestType(pixel) });
        }
    }
    UnloadImageColors(pixels);
    return targets;
}

// cubic bezier, p0 and p3 are the ends, p1 and p2 the control points
static Eigen::Vector2f bezier(const Eigen::Vector2f& p0, const Eigen::Vector2f& p1, const Eigen::Vector2f& p2,
    const Eigen::Vector2f& p3, float t)
{
    const float u = 1.0f - t;
    return u * u * u * p0 + 3.0f * u * u * t * p1 + 3.0f * u * t * t * p2 + t * t * t * p3;
}

// even-odd crossing test, polygon is closed implicitly
static bool insidePolygon(const std::vector<Eigen::Vector2f>& polygon, const Eigen::Vector2f& point)
{
    bool inside = false;
    for (std::size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const Eigen::Vector2f& a = polygon[i];
        const Eigen::Vector2f& b = polygon[j];
        if ((a.y() > point.y()) != (b.y() > point.y())
            && point.x() < (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x())
            inside = !inside;
    }
    return inside;
}

// body outline in "balloon units": y = -1 at the crown, 1 at the basket bottom, x symmetric around 0
// right half goes crown -> widest point -> rope opening, left half is its mirror
static std::vector<Eigen::Vector2f> balloonBody()
{
    const std::array<std::array<Eigen::Vector2f, 4>, 2> rightHalf { {
        { Eigen::Vector2f(0.0f, -1.0f), Eigen::Vector2f(0.43f, -1.0f), Eigen::Vector2f(0.78f, -0.78f), Eigen::Vector2f(0.78f, -0.42f) },
        { Eigen::Vector2f(0.78f, -0.42f), Eigen::Vector2f(0.78f, -0.06f), Eigen::Vector2f(0.36f, 0.2f), Eigen::Vector2f(0.13f, 0.38f) },
    } };
    const int steps = 24;

    std::vector<Eigen::Vector2f> outline;
    for (const auto& curve : rightHalf)
        for (int step = 0; step < steps; step++)
            outline.push_back(bezier(curve[0], curve[1], curve[2], curve[3], step / static_cast<float>(steps)));
    outline.push_back(Eigen::Vector2f(0.13f, 0.38f));

    // mirror, walking back up the left side so the polygon stays a simple loop
    const int rightCount = static_cast<int>(outline.size());
    for (int i = rightCount - 1; i > 0; i--)
        outline.push_back(Eigen::Vector2f(-outline[i].x(), outline[i].y()));
    return outline;
}

// thin quad from a to b
static std::vector<Eigen::Vector2f> ropeQuad(const Eigen::Vector2f& a, const Eigen::Vector2f& b, float thickness)
{
    const Eigen::Vector2f direction = (b - a).normalized();
    const Eigen::Vector2f normal(-direction.y() * thickness * 0.5f, direction.x() * thickness * 0.5f);
    return { a + normal, b + normal, b - normal, a - normal };
}

std::vector<ShapeTarget> rasterizeBalloon(float height, std::mt19937& rng)
{
    std::vector<ShapeTarget> targets;
    if (height <= 0.0f)
        return targets;

    // balloon units span 2 vertically, pixelsPerUnit converts them to oversampled raster pixels
    const float pixelsPerUnit = height * 0.5f * rasterOversampling;
    const float halfWidthUnits = 0.82f;
    const int imageWidth = std::max(1, static_cast<int>(std::ceil(2.0f * halfWidthUnits * pixelsPerUnit)));
    const int imageHeight = std::max(1, static_cast<int>(std::ceil(2.0f * pixelsPerUnit)));
    Image image = GenImageColor(imageWidth, imageHeight, BLANK);

    const std::vector<Eigen::Vector2f> body = balloonBody();
    const std::vector<Eigen::Vector2f> leftRope = ropeQuad(Eigen::Vector2f(-0.12f, 0.36f), Eigen::Vector2f(-0.17f, 0.74f), 0.04f);
    const std::vector<Eigen::Vector2f> rightRope = ropeQuad(Eigen::Vector2f(0.12f, 0.36f), Eigen::Vector2f(0.17f, 0.74f), 0.04f);

    for (int py = 0; py < imageHeight; py++) {
        for (int px = 0; px < imageWidth; px++) {
            // pixel center back into balloon units
            const Eigen::Vector2f unit((px + 0.5f) / pixelsPerUnit - halfWidthUnits, (py + 0.5f) / pixelsPerUnit - 1.0f);
            if (insidePolygon(body, unit) || insidePolygon(leftRope, unit) || insidePolygon(rightRope, unit))
                ImageDrawPixel(&image, px, py, WHITE);
        }
    }

    // basket: rectangle with its corners rounded by 4 circles
    const float basketLeft = (halfWidthUnits - 0.22f) * pixelsPerUnit;
    const float basketTop = (1.0f + 0.72f) * pixelsPerUnit;
    const float basketWidth = 0.44f * pixelsPerUnit;
    const float basketHeight = 0.27f * pixelsPerUnit;
    const int corner = std::max(1, static_cast<int>(0.06f * pixelsPerUnit));
    ImageDrawRectangleRec(&image, Rectangle { basketLeft + corner, basketTop, basketWidth - 2.0f * corner, basketHeight }, WHITE);
    ImageDrawRectangleRec(&image, Rectangle { basketLeft, basketTop + corner, basketWidth, basketHeight - 2.0f * corner }, WHITE);
    ImageDrawCircleV(&image, Vector2 { basketLeft + corner, basketTop + corner }, corner, WHITE);
    ImageDrawCircleV(&image, Vector2 { basketLeft + basketWidth - corner, basketTop + corner }, corner, WHITE);
    ImageDrawCircleV(&image, Vector2 { basketLeft + corner, basketTop + basketHeight - corner }, corner, WHITE);
    ImageDrawCircleV(&image, Vector2 { basketLeft + basketWidth - corner, basketTop + basketHeight - corner }, corner, WHITE);

    // same threshold and stride rule as text, origin puts the bounding box center at (0, 0)
    const float scale = 1.0f / rasterOversampling;
    const Eigen::Vector2f origin(-imageWidth * 0.5f * scale, -imageHeight * 0.5f * scale);
    sampleImage(image, sampleStride(height * 0.5f), origin, scale, rng, targets);
    UnloadImage(image);
    return targets;
}
