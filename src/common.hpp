#pragma once
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline Vec2i operator+(const Vec2i& a, const Vec2i& b) {
    return { a.x + b.x, a.y + b.y };
}

inline std::string toString(const Vec2i& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}
