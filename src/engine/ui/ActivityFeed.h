// ActivityFeed.h

#pragma once
#include <string>
#include <deque>
#include <vector>
#include <glm/glm.hpp>
#include <memory>

class TextRenderer;

struct FeedLine {
    std::string text;
    glm::vec3 color;
    float age = 0.f;
    float lifetime = 3.f;
};

// Bottom-right overlay of recent table activity (draws, stacks, warnings).
class ActivityFeed {
public:
    ActivityFeed(const std::string& fontPath, int fontSize);
    ~ActivityFeed();

    void update(float dt);
    void render(int screenW, int screenH);

    void push(const std::string& msg, const glm::vec3& color = {1,1,1}, float lifetime = 3.f);
    void clear();

private:
    std::unique_ptr<TextRenderer> text;
    std::deque<FeedLine> lines;
    int   maxLines  = 6;
    float lineGap   = 4.f;
    float wrapWidth = 420.f;   // pixels
    float baseScale = 0.8f;
    float fadePortion = 0.25f; // last quarter of a line's life fades out

    std::vector<std::string> wrap(const std::string& s, float maxWidth, float scale) const;
};
