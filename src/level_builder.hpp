#pragma once

#include "grid_utils.hpp"
#include "level_config.hpp"
#include "rng.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Retry orchestrator around the walk + wall passes.
//
// generate() validates the config up front, then runs fresh walks until one
// reaches cfg.minFloorTiles or cfg.maxGenerationAttempts walks have failed.
// Failed attempts are discarded whole. The RNG is shared across attempts and
// is never reseeded, so consecutive attempts walk differently.
//
// Consumers (tile painting, spawners) are called once per successful
// generate(), never for a rejected attempt.

enum class LogLevel : uint8_t {
    Info = 0,
    Warn,
    Error,
};

using LevelLog = std::function<void(LogLevel, const std::string&)>;

// Info to stdout, warnings/errors to stderr.
void defaultLevelLog(LogLevel level, const std::string& msg);

enum class BuildState : uint8_t {
    Idle = 0,
    Attempting,
    Success,
    Exhausted,
};

inline const char* buildStateName(BuildState s) {
    switch (s) {
        case BuildState::Idle:       return "Idle";
        case BuildState::Attempting: return "Attempting";
        case BuildState::Success:    return "Success";
        case BuildState::Exhausted:  return "Exhausted";
    }
    return "Unknown";
}

// Append-only.
enum class GenerationStatus : uint8_t {
    Success = 0,
    Exhausted,
    InvalidConfig,
};

inline const char* generationStatusName(GenerationStatus s) {
    switch (s) {
        case GenerationStatus::Success:       return "Success";
        case GenerationStatus::Exhausted:     return "Exhausted";
        case GenerationStatus::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

struct GenerationResult {
    GenerationStatus status = GenerationStatus::InvalidConfig;

    // Only filled on Success.
    CellSet floor;
    CellSet walls;

    // Walks actually run. Equals config.maxGenerationAttempts when Exhausted,
    // 0 for InvalidConfig.
    int attempts = 0;

    GenerationConfig config;

    // Human readable reason for Exhausted / InvalidConfig.
    std::string error;

    bool ok() const { return status == GenerationStatus::Success; }
};

// Rendering collaborator: receives the final floor and wall sets.
using LayoutCallback = std::function<void(const CellSet& floor, const CellSet& walls)>;

// Placement collaborators (enemy/collectible spawners, ...).
using PlacementCallback = std::function<void(const CellSet& floor, const Vec2i& start)>;

class LevelBuilder {
public:
    LevelBuilder(const GenerationConfig& cfg, RNG& rng);

    void setLog(LevelLog log) { log_ = std::move(log); }

    void setLayoutSink(LayoutCallback cb) { layoutSink_ = std::move(cb); }
    void addPlacementSink(PlacementCallback cb);
    size_t placementSinkCount() const { return placementSinks_.size(); }

    GenerationResult generate();

    BuildState state() const { return state_; }
    int attemptsUsed() const { return attempts_; }
    const GenerationConfig& config() const { return cfg_; }

    // Valid after a successful generate(); empty otherwise.
    const CellSet& floor() const { return floor_; }
    const Vec2i& startPosition() const { return cfg_.startPosition; }

private:
    void log(LogLevel level, const std::string& msg) const;
    void publish() const;

    GenerationConfig cfg_;
    RNG& rng_;
    LevelLog log_;

    LayoutCallback layoutSink_;
    std::vector<PlacementCallback> placementSinks_;

    BuildState state_ = BuildState::Idle;
    int attempts_ = 0;
    CellSet floor_;
    CellSet walls_;
};

// One-shot convenience wrapper with logging disabled.
GenerationResult generateLevel(const GenerationConfig& cfg, RNG& rng);
