// ActivityFeed.cpp

#include "ActivityFeed.h"
#include "TextRenderer.h"
#include <algorithm>

ActivityFeed::ActivityFeed(const std::string& fontPath, int fontSize)
    : text(std::make_unique<TextRenderer>(fontPath, fontSize))
{}

ActivityFeed::~ActivityFeed() = default;

void ActivityFeed::push(const std::string& msg, const glm::vec3& color, float lifetime) {
    if (msg.empty()) return;
    lines.push_back({msg, color, 0.f, std::max(lifetime, 0.1f)});
    while (static_cast<int>(lines.size()) > maxLines) lines.pop_front();
}

void ActivityFeed::clear() { lines.clear(); }

void ActivityFeed::update(float dt) {
    for (auto& l : lines) l.age += dt;
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [](const FeedLine& l) { return l.age >= l.lifetime; }),
                lines.end());
}

void ActivityFeed::render(int screenW, int screenH) {
    if (!text || lines.empty()) return;

    const float pad = 16.f;
    int fh = text->lineHeight();
    if (fh <= 0) fh = 24;
    const float lineH = fh * baseScale;

    // Right-aligned column, newest line at the bottom.
    float y = screenH - pad - lineH;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const FeedLine& ln = *it;

        float t = std::clamp(ln.age / ln.lifetime, 0.f, 1.f);
        float start = 1.f - fadePortion;
        float alpha = (t < start) ? 1.f : std::max(0.f, 1.f - (t - start) / fadePortion);

        auto wrapped = wrap(ln.text, wrapWidth, baseScale);
        for (auto w = wrapped.rbegin(); w != wrapped.rend(); ++w) {
            float x = screenW - pad - text->measureTextWidth(*w, baseScale);
            text->renderText(*w, x, y, ln.color, baseScale, alpha);
            y -= lineH;
            if (y < -lineH) return;
        }
        y -= lineGap;
    }
}

std::vector<std::string> ActivityFeed::wrap(const std::string& s, float maxWidth, float scale) const {
    std::vector<std::string> out;
    std::string cur, word;

    auto place = [&]() {
        if (word.empty()) return;
        std::string candidate = cur.empty() ? word : cur + " " + word;
        if (!cur.empty() && text->measureTextWidth(candidate, scale) > maxWidth) {
            out.push_back(cur);
            cur = word;
        } else {
            cur = candidate;
        }
        word.clear();
    };

    for (char c : s) {
        if (c == ' ') place();
        else word.push_back(c);
    }
    place();
    if (!cur.empty()) out.push_back(cur);
    if (out.empty()) out.push_back(s);
    return out;
}
