#include "level_builder.hpp"
#include "walk_gen.hpp"
#include "wall_gen.hpp"

#include <iostream>
#include <sstream>
#include <utility>

void defaultLevelLog(LogLevel level, const std::string& msg) {
    switch (level) {
        case LogLevel::Info:
            std::cout << msg << "\n";
            break;
        case LogLevel::Warn:
            std::cerr << "[warn] " << msg << "\n";
            break;
        case LogLevel::Error:
            std::cerr << "[error] " << msg << "\n";
            break;
    }
}

LevelBuilder::LevelBuilder(const GenerationConfig& cfg, RNG& rng)
    : cfg_(cfg), rng_(rng), log_(defaultLevelLog) {}

void LevelBuilder::addPlacementSink(PlacementCallback cb) {
    if (cb) placementSinks_.push_back(std::move(cb));
}

void LevelBuilder::log(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
}

void LevelBuilder::publish() const {
    if (layoutSink_) layoutSink_(floor_, walls_);
    for (const auto& sink : placementSinks_) {
        sink(floor_, cfg_.startPosition);
    }
}

GenerationResult LevelBuilder::generate() {
    GenerationResult out;
    out.config = cfg_;

    state_ = BuildState::Idle;
    attempts_ = 0;
    floor_.clear();
    walls_.clear();

    std::string err;
    if (!validateConfig(cfg_, &err)) {
        out.status = GenerationStatus::InvalidConfig;
        out.error = "Invalid generation config: " + err;
        log(LogLevel::Error, out.error);
        return out;
    }

    state_ = BuildState::Attempting;
    const size_t minFloor = static_cast<size_t>(cfg_.minFloorTiles);

    while (attempts_ < cfg_.maxGenerationAttempts) {
        // Nothing from a rejected walk survives into the next one.
        CellSet candidate = generateWalkFloor(cfg_, rng_);

        if (candidate.size() >= minFloor) {
            ++attempts_;
            floor_ = std::move(candidate);
            walls_ = deriveWalls(floor_);
            state_ = BuildState::Success;

            std::ostringstream ss;
            ss << "Level generated successfully after " << attempts_
               << " attempt(s). Floor tiles: " << floor_.size();
            log(LogLevel::Info, ss.str());

            publish();

            out.status = GenerationStatus::Success;
            out.floor = floor_;
            out.walls = walls_;
            out.attempts = attempts_;
            return out;
        }

        ++attempts_;
        std::ostringstream ss;
        ss << "Generated level too small (" << candidate.size() << " tiles). Retrying... (Attempt "
           << attempts_ << "/" << cfg_.maxGenerationAttempts << ")";
        log(LogLevel::Info, ss.str());
    }

    state_ = BuildState::Exhausted;

    std::ostringstream ss;
    ss << "Failed to generate a valid level after " << cfg_.maxGenerationAttempts << " attempts. "
       << "Try increasing walkSteps or decreasing minFloorTiles.";
    if (maxPossibleFloorTiles(cfg_) < static_cast<long long>(cfg_.minFloorTiles)) {
        ss << " (minFloorTiles " << cfg_.minFloorTiles << " exceeds the " << maxPossibleFloorTiles(cfg_)
           << " cells this walk can reach)";
    }

    out.status = GenerationStatus::Exhausted;
    out.attempts = attempts_;
    out.error = ss.str();
    log(LogLevel::Error, out.error);
    return out;
}

GenerationResult generateLevel(const GenerationConfig& cfg, RNG& rng) {
    LevelBuilder builder(cfg, rng);
    builder.setLog(nullptr);
    return builder.generate();
}
