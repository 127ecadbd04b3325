#include "level_config.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>

namespace {

bool fail(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

} // namespace

long long maxPossibleFloorTiles(const GenerationConfig& cfg) {
    if (cfg.walkSteps <= 0 || cfg.stampSize < 0) return 0;
    const long long w = stampWidth(cfg.stampSize);
    return static_cast<long long>(cfg.walkSteps) * w * w;
}

long long maxReachFromStart(const GenerationConfig& cfg) {
    return static_cast<long long>(cfg.walkSteps) + cfg.stampSize + 1;
}

bool validateConfig(const GenerationConfig& cfg, std::string* err) {
    std::ostringstream ss;
    if (cfg.walkSteps <= 0) {
        ss << "walkSteps must be positive (got " << cfg.walkSteps << ")";
        return fail(err, ss.str());
    }
    if (cfg.stampSize < 0 || cfg.stampSize > kMaxStampSize) {
        ss << "stampSize must be in [0, " << kMaxStampSize << "] (got " << cfg.stampSize << ")";
        return fail(err, ss.str());
    }
    if (cfg.minFloorTiles <= 0) {
        ss << "minFloorTiles must be positive (got " << cfg.minFloorTiles << ")";
        return fail(err, ss.str());
    }
    if (cfg.maxGenerationAttempts <= 0) {
        ss << "maxGenerationAttempts must be positive (got " << cfg.maxGenerationAttempts << ")";
        return fail(err, ss.str());
    }

    const long long limit = std::numeric_limits<int>::max();
    const long long reach = maxReachFromStart(cfg);
    const long long ax = std::llabs(static_cast<long long>(cfg.startPosition.x));
    const long long ay = std::llabs(static_cast<long long>(cfg.startPosition.y));
    if (ax + reach > limit || ay + reach > limit) {
        ss << "startPosition " << toString(cfg.startPosition) << " is within " << reach
           << " cells of the int range; the walk would overflow";
        return fail(err, ss.str());
    }
    return true;
}
