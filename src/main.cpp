#define SDL_MAIN_HANDLED
#include <SDL.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "level_builder.hpp"
#include "level_export.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitExhausted = 1;
constexpr int kExitUsage = 2;

void printUsage(const char* exe) {
    std::cout
        << STAMPWALK_APPNAME << " " << STAMPWALK_VERSION << "\n"
        << "Usage: " << (exe ? exe : "stampwalk") << " [options]\n\n"
        << "Options:\n"
        << "  --config <path>        Settings file (default: stampwalk_settings.ini in the user pref dir)\n"
        << "  --reset-settings       Overwrite the settings file with fresh defaults\n"
        << "  --seed <n>             RNG seed (default: settings seed, or the SDL tick count if 0)\n"
        << "  --save-seed            Store the seed used in the settings file so the next run repeats it\n"
        << "  --steps <n>            Override walk_steps\n"
        << "  --stamp <n>            Override stamp_size (0..3)\n"
        << "  --min-floor <n>        Override min_floor_tiles\n"
        << "  --max-attempts <n>     Override max_generation_attempts\n"
        << "  --start <x,y>          Override the walker start cell\n"
        << "  --print                Print the level as ASCII ('.' floor, '#' wall, '@' start)\n"
        << "  --json-report <path>   Write a JSON summary of the run\n"
        << "  --quiet                Only log warnings and errors\n"
        << "\n"
        << "  --version, -v          Print version and exit\n"
        << "  --help, -h             Show this help and exit\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseIntArg(const std::string& s, int& out) {
    try {
        size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseCell(const std::string& s, Vec2i& out) {
    const auto comma = s.find(',');
    if (comma == std::string::npos) return false;
    Vec2i p;
    if (!parseIntArg(s.substr(0, comma), p.x)) return false;
    if (!parseIntArg(s.substr(comma + 1), p.y)) return false;
    out = p;
    return true;
}

std::filesystem::path defaultSettingsPath() {
    std::filesystem::path baseDir;
    if (char* p = SDL_GetPrefPath("stampwalk", STAMPWALK_APPNAME)) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }
    return baseDir / "stampwalk_settings.ini";
}

struct CliOptions {
    std::string configPath;
    bool resetSettings = false;
    std::optional<uint32_t> seed;
    bool saveSeed = false;
    std::optional<int> walkSteps;
    std::optional<int> stampSize;
    std::optional<int> minFloorTiles;
    std::optional<int> maxAttempts;
    std::optional<Vec2i> start;
    bool print = false;
    std::string jsonReport;
    bool quiet = false;
};

// Returns false on a malformed command line (message already printed).
bool parseCli(int argc, char** argv, CliOptions& opt) {
    auto needValue = [&](int& i, const std::string& flag, std::string& v) {
        if (argValue(i, argc, argv, v)) return true;
        std::cerr << flag << " requires a value\n";
        return false;
    };
    auto intOverride = [&](int& i, const std::string& flag, std::optional<int>& dst) {
        std::string v;
        if (!needValue(i, flag, v)) return false;
        int n = 0;
        if (!parseIntArg(v, n)) {
            std::cerr << "Invalid " << flag << ": " << v << "\n";
            return false;
        }
        dst = n;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;
        if (a == "--config") {
            if (!needValue(i, a, opt.configPath)) return false;
        } else if (a == "--reset-settings") {
            opt.resetSettings = true;
        } else if (a == "--seed") {
            if (!needValue(i, a, v)) return false;
            uint32_t s = 0;
            if (!parseU32(v, s)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return false;
            }
            opt.seed = s;
        } else if (a == "--save-seed") {
            opt.saveSeed = true;
        } else if (a == "--steps") {
            if (!intOverride(i, a, opt.walkSteps)) return false;
        } else if (a == "--stamp") {
            if (!intOverride(i, a, opt.stampSize)) return false;
        } else if (a == "--min-floor") {
            if (!intOverride(i, a, opt.minFloorTiles)) return false;
        } else if (a == "--max-attempts") {
            if (!intOverride(i, a, opt.maxAttempts)) return false;
        } else if (a == "--start") {
            if (!needValue(i, a, v)) return false;
            Vec2i p;
            if (!parseCell(v, p)) {
                std::cerr << "Invalid --start (expected x,y): " << v << "\n";
                return false;
            }
            opt.start = p;
        } else if (a == "--print") {
            opt.print = true;
        } else if (a == "--json-report") {
            if (!needValue(i, a, opt.jsonReport)) return false;
        } else if (a == "--quiet") {
            opt.quiet = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (a == "--version" || a == "-v") {
            std::cout << STAMPWALK_APPNAME << " " << STAMPWALK_VERSION << "\n";
            return kExitOk;
        }
    }

    CliOptions opt;
    if (!parseCli(argc, argv, opt)) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    if (SDL_Init(SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return kExitUsage;
    }

    const std::string settingsPath = opt.configPath.empty() ? defaultSettingsPath().string() : opt.configPath;

    {
        std::error_code ec;
        const bool exists = std::filesystem::exists(settingsPath, ec);
        if (opt.resetSettings || !exists) {
            if (!writeDefaultSettings(settingsPath)) {
                std::cerr << "[warn] Could not write settings file: " << settingsPath << "\n";
            }
        }
    }

    std::string warns;
    Settings settings = loadSettings(settingsPath, &warns);
    if (!warns.empty()) {
        std::cerr << "[warn] " << settingsPath << ":\n" << warns;
    }

    GenerationConfig cfg = settings.gen;
    if (opt.walkSteps) cfg.walkSteps = *opt.walkSteps;
    if (opt.stampSize) cfg.stampSize = *opt.stampSize;
    if (opt.minFloorTiles) cfg.minFloorTiles = *opt.minFloorTiles;
    if (opt.maxAttempts) cfg.maxGenerationAttempts = *opt.maxAttempts;
    if (opt.start) cfg.startPosition = *opt.start;

    uint32_t seed = settings.seed;
    if (opt.seed) seed = *opt.seed;
    if (seed == 0) seed = mixSeed(static_cast<uint32_t>(SDL_GetTicks()));

    RNG rng(seed);
    LevelBuilder builder(cfg, rng);
    if (opt.quiet) {
        builder.setLog([](LogLevel level, const std::string& msg) {
            if (level != LogLevel::Info) defaultLevelLog(level, msg);
        });
    }

    if (opt.print) {
        builder.setLayoutSink([&cfg](const CellSet& floor, const CellSet& walls) {
            std::cout << renderAscii(floor, walls, cfg.startPosition);
        });
    }

    if (!opt.quiet) {
        std::cout << STAMPWALK_APPNAME << " seed " << seed << ", start " << toString(cfg.startPosition) << "\n";
    }

    const GenerationResult result = builder.generate();

    if (!opt.jsonReport.empty()) {
        std::string err;
        if (!writeJsonReport(opt.jsonReport, result, seed, &err)) {
            std::cerr << "[error] " << err << "\n";
        }
    }

    if (opt.saveSeed) {
        if (!updateIniKey(settingsPath, "seed", std::to_string(seed))) {
            std::cerr << "[warn] Could not store seed in settings file: " << settingsPath << "\n";
        } else if (!opt.quiet) {
            std::cout << "Seed " << seed << " saved to " << settingsPath << "\n";
        }
    }

    SDL_Quit();

    switch (result.status) {
        case GenerationStatus::Success:       return kExitOk;
        case GenerationStatus::Exhausted:     return kExitExhausted;
        case GenerationStatus::InvalidConfig: return kExitUsage;
    }
    return kExitUsage;
}
