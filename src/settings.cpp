#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseInt(const std::string& v, int& out) {
    const std::string t = trim(v);
    try {
        size_t used = 0;
        const int r = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = r;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string t = trim(v);
    if (t.empty() || t[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long r = std::stoull(t, &used, 10);
        if (used != t.size() || r > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(r);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void warn(std::string* warnings, int lineNo, const std::string& msg) {
    if (!warnings) return;
    std::ostringstream ss;
    ss << "line " << lineNo << ": " << msg << "\n";
    *warnings += ss.str();
}

} // namespace

Settings loadSettings(const std::string& path, std::string* warnings) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            warn(warnings, lineNo, "expected key = value");
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        int* intField = nullptr;
        if (key == "walk_steps") intField = &s.gen.walkSteps;
        else if (key == "stamp_size") intField = &s.gen.stampSize;
        else if (key == "min_floor_tiles") intField = &s.gen.minFloorTiles;
        else if (key == "max_generation_attempts") intField = &s.gen.maxGenerationAttempts;
        else if (key == "start_x") intField = &s.gen.startPosition.x;
        else if (key == "start_y") intField = &s.gen.startPosition.y;

        if (intField) {
            int v = 0;
            if (parseInt(val, v)) *intField = v;
            else warn(warnings, lineNo, "invalid integer for " + key + ": '" + val + "'");
        } else if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(val, v)) s.seed = v;
            else warn(warnings, lineNo, "invalid seed: '" + val + "'");
        } else {
            warn(warnings, lineNo, "unknown key '" + key + "'");
        }
    }

    return s;
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;

    bool found = false;
    while (std::getline(in, line)) {
        std::string raw = line;

        // Strip comments for matching, but preserve the original line for output when not matching.
        auto commentPos = raw.find_first_of("#;");
        if (commentPos != std::string::npos) raw = raw.substr(0, commentPos);

        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == toLower(key)) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }

        lines.push_back(line);
    }
    in.close();

    if (!found) {
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return static_cast<bool>(out);
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# StampWalk settings
#
# Lines are: key = value
# Comments start with # or ;
#
# Values are not clamped: an out-of-range value makes generation fail
# with a configuration error instead.

# Random walk
# walk_steps: number of stamp-then-move iterations (> 0, typically 50..500)
walk_steps = 200
# stamp_size: 0 = single tile, 1 = 3x3, 2 = 5x5, 3 = 7x7
stamp_size = 1

# Walker start cell
start_x = 0
start_y = 0

# Validity / retries
# min_floor_tiles: a level with fewer floor cells is rejected (> 0)
min_floor_tiles = 100
# max_generation_attempts: walks to try before giving up (> 0)
max_generation_attempts = 100

# seed: 0 picks a new seed every run
seed = 0
)INI";

    return static_cast<bool>(f);
}
