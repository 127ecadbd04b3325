#include "level_export.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace {

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

void growBounds(CellBounds& b, const Vec2i& p) {
    if (b.empty()) {
        b.minX = b.maxX = p.x;
        b.minY = b.maxY = p.y;
        return;
    }
    b.minX = std::min(b.minX, p.x);
    b.minY = std::min(b.minY, p.y);
    b.maxX = std::max(b.maxX, p.x);
    b.maxY = std::max(b.maxY, p.y);
}

void writeCellArray(std::ostream& out, const CellSet& cells) {
    out << "[";
    bool first = true;
    for (const Vec2i& p : sortedCells(cells)) {
        if (!first) out << ",";
        first = false;
        out << "[" << p.x << "," << p.y << "]";
    }
    out << "]";
}

} // namespace

CellBounds boundsOf(const CellSet& cells) {
    CellBounds b;
    for (const Vec2i& p : cells) growBounds(b, p);
    return b;
}

CellBounds boundsOf(const CellSet& a, const CellSet& b) {
    CellBounds out = boundsOf(a);
    for (const Vec2i& p : b) growBounds(out, p);
    return out;
}

std::vector<Vec2i> sortedCells(const CellSet& cells) {
    std::vector<Vec2i> out(cells.begin(), cells.end());
    std::sort(out.begin(), out.end(), [](const Vec2i& a, const Vec2i& b) {
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });
    return out;
}

std::string renderAscii(const CellSet& floor, const CellSet& walls, const Vec2i& start) {
    const CellBounds b = boundsOf(floor, walls);
    if (b.empty()) return {};

    const int w = b.width();
    const int h = b.height();
    std::vector<std::string> rows(static_cast<size_t>(h), std::string(static_cast<size_t>(w), ' '));

    auto put = [&](const Vec2i& p, char c) {
        const size_t row = static_cast<size_t>(b.maxY - p.y);
        const size_t col = static_cast<size_t>(p.x - b.minX);
        rows[row][col] = c;
    };

    for (const Vec2i& p : walls) put(p, '#');
    for (const Vec2i& p : floor) put(p, '.');
    if (contains(floor, start)) put(start, '@');

    std::string out;
    out.reserve(static_cast<size_t>((w + 1) * h));
    for (const auto& r : rows) {
        out += r;
        out += '\n';
    }
    return out;
}

bool writeJsonReport(const std::string& path, const GenerationResult& result, uint32_t seed, std::string* err) {
    std::ofstream out(path);
    if (!out) {
        if (err) *err = "Failed to open JSON report for writing: " + path;
        return false;
    }

    const GenerationConfig& cfg = result.config;
    const CellBounds b = boundsOf(result.floor, result.walls);

    out << "{\n";
    out << "  \"status\": \"" << generationStatusName(result.status) << "\",\n";
    out << "  \"seed\": " << seed << ",\n";
    out << "  \"attempts\": " << result.attempts << ",\n";
    out << "  \"error\": \"" << jsonEscape(result.error) << "\",\n";
    out << "  \"config\": {"
        << "\"walkSteps\": " << cfg.walkSteps
        << ", \"stampSize\": " << cfg.stampSize
        << ", \"minFloorTiles\": " << cfg.minFloorTiles
        << ", \"maxGenerationAttempts\": " << cfg.maxGenerationAttempts
        << ", \"startPosition\": [" << cfg.startPosition.x << "," << cfg.startPosition.y << "]"
        << "},\n";
    if (b.empty()) {
        out << "  \"bounds\": null,\n";
    } else {
        out << "  \"bounds\": {\"minX\": " << b.minX << ", \"minY\": " << b.minY
            << ", \"maxX\": " << b.maxX << ", \"maxY\": " << b.maxY << "},\n";
    }
    out << "  \"floorCount\": " << result.floor.size() << ",\n";
    out << "  \"wallCount\": " << result.walls.size() << ",\n";
    out << "  \"floor\": ";
    writeCellArray(out, result.floor);
    out << ",\n";
    out << "  \"walls\": ";
    writeCellArray(out, result.walls);
    out << "\n}\n";

    if (!out) {
        if (err) *err = "Failed to write JSON report: " + path;
        return false;
    }
    return true;
}
