#include "balloon.hpp"

static Eigen::Vector2f centroidOf(const std::vector<ShapeTarget>& targets)
{
    Eigen::Vector2f sum = Eigen::Vector2f::Zero();
    for (const ShapeTarget& target : targets)
        sum += Eigen::Vector2f(target.x, target.y);
    return sum / static_cast<float>(targets.size());
}

bool findLetterDot(const TextShape& shape, const std::string& text, const std::string& word, Eigen::Vector2f& dot)
{
    if (shape.targets.empty() || shape.glyphs.empty())
        return false;

    // which glyph is the "i", -1 when the word or its "i" isn't there
    int letter = -1;
    const std::string::size_type wordAt = text.find(word);
    const std::string::size_type iAt = wordAt == std::string::npos ? std::string::npos : word.find('i');
    if (iAt != std::string::npos) {
        const int offset = static_cast<int>(wordAt + iAt);
        for (int g = 0; g < static_cast<int>(shape.glyphs.size()); g++)
            if (shape.glyphs[g].offset == offset)
                letter = g;
    }

    const float fontSize = shape.fontSize;
    // one sample step in plane units, a gap of a few steps separates the dot from the stem
    const float step = sampleStride(fontSize) / static_cast<float>(rasterOversampling);

    if (letter >= 0) {
        const Eigen::AlignedBox2f& cell = shape.glyphs[letter].box;
        std::vector<ShapeTarget> column;
        for (const ShapeTarget& target : shape.targets) {
            if (target.x >= cell.min().x() && target.x <= cell.max().x() && target.y >= cell.min().y()
                && target.y <= cell.min().y() + 0.6f * fontSize)
                column.push_back(target);
        }
        std::sort(column.begin(), column.end(), [](const ShapeTarget& a, const ShapeTarget& b) { return a.y < b.y; });

        for (std::size_t k = 1; k < column.size(); k++) {
            if (column[k].y - column[k - 1].y > 2.5f * step) {
                const std::vector<ShapeTarget> cluster(column.begin(), column.begin() + k);
                float left = cluster.front().x;
                float right = cluster.front().x;
                for (const ShapeTarget& target : cluster) {
                    left = std::min(left, target.x);
                    right = std::max(right, target.x);
                }
                // narrow and small compared to the letter, otherwise it's not a dot
                if (right - left <= cell.sizes().x() && cluster.size() < column.size()) {
                    dot = centroidOf(cluster);
                    return true;
                }
                break;
            }
        }
    }

    // fallback: topmost targets in a broader band around the letter (or around the first line)
    float bandLeft = -std::numeric_limits<float>::infinity();
    float bandRight = std::numeric_limits<float>::infinity();
    if (letter >= 0) {
        bandLeft = shape.glyphs[letter].box.min().x() - fontSize;
        bandRight = shape.glyphs[letter].box.max().x() + fontSize;
    }
    std::vector<ShapeTarget> band;
    for (const ShapeTarget& target : shape.targets)
        if (target.x >= bandLeft && target.x <= bandRight)
            band.push_back(target);
    if (band.empty())
        band = shape.targets;

    const std::size_t keep = std::min<std::size_t>(12, band.size());
    std::partial_sort(band.begin(), band.begin() + keep, band.end(),
        [](const ShapeTarget& a, const ShapeTarget& b) { return a.y < b.y; });
    band.resize(keep);
    dot = centroidOf(band);
    return true;
}

std::vector<int> recruitNearest(const Particles& particles, const Eigen::Vector2f& point, int count)
{
    const int total = particles.size();
    count = std::min(count, total);

    Eigen::ArrayXf distanceSquared = (particles.posX - point.x()).square() + (particles.posY - point.y()).square();
    std::vector<int> order(total);
    for (int index = 0; index < total; index++)
        order[index] = index;
    std::partial_sort(order.begin(), order.begin() + count, order.end(),
        [&](int a, int b) { return distanceSquared[a] < distanceSquared[b]; });
    order.resize(count);
    return order;
}

BalloonFlight launchBalloon(const Particles& particles, const TextShape& shape, const Message& message, std::mt19937& rng)
{
    BalloonFlight flight;

    Eigen::Vector2f dot;
    if (!findLetterDot(shape, message.text, message.balloonWord, dot)) {
        TraceLog(LOG_WARNING, "HERO: No balloon anchor in \"%s\"", message.text.c_str());
        return flight;
    }

    std::vector<ShapeTarget> outline = rasterizeBalloon(shape.fontSize * balloonHeightFactor, rng);
    if (outline.empty())
        return flight;
    shuffleTargets(outline, rng);

    flight.recruits = recruitNearest(particles, dot, balloonParticles);
    if (flight.recruits.empty())
        return flight;

    // one outline point per recruit (cycling when the outline is sparse), centered on their own centroid
    const int recruitCount = static_cast<int>(flight.recruits.size());
    std::vector<ShapeTarget> chosen;
    for (int k = 0; k < recruitCount; k++)
        chosen.push_back(outline[k % outline.size()]);
    const Eigen::Vector2f centroid = centroidOf(chosen);

    float top = 0.0f;
    float bottom = 0.0f;
    for (const ShapeTarget& point : chosen) {
        const Eigen::Vector2f offset = Eigen::Vector2f(point.x, point.y) - centroid;
        flight.offsets.push_back(offset);
        top = std::min(top, offset.y());
        bottom = std::max(bottom, offset.y());
    }

    // basket sits on the dot, then the whole thing floats up until the crown touches the top margin
    flight.start = Eigen::Vector2f(dot.x(), dot.y() - bottom);
    flight.rise = std::max(0.0f, flight.start.y() - (balloonTopMargin - top));

    flight.active = true;
    TraceLog(LOG_DEBUG, "HERO: Balloon launched with %d particles from (%.0f, %.0f)", recruitCount, dot.x(), dot.y());
    return flight;
}

float easeInOutCubic(float t)
{
    t = std::min(1.0f, std::max(0.0f, t));
    return t < 0.5f ? 4.0f * t * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 3.0f) / 2.0f;
}

void steerBalloon(Particles& particles, const BalloonFlight& flight, float progress)
{
    if (!flight.active)
        return;

    const Eigen::Vector2f centroid = flight.start - Eigen::Vector2f(0.0f, flight.rise * easeInOutCubic(progress));
    for (std::size_t k = 0; k < flight.recruits.size(); k++) {
        const int index = flight.recruits[k];
        particles.targetX[index] = centroid.x() + flight.offsets[k].x();
        particles.targetY[index] = centroid.y() + flight.offsets[k].y();
        particles.hasTarget[index] = true;
    }
}
