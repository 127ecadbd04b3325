#pragma once

#include <cstdint>
#include <string>

#include "level_config.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The CLI creates it in the per-user pref directory (SDL_GetPrefPath) on first run.
struct Settings {
    GenerationConfig gen;

    // 0 = pick a fresh seed each run.
    uint32_t seed = 0;
};

// Loads settings from disk. If the file is missing, defaults are used.
// Unknown keys and unparsable values are skipped and described in `warnings`
// (one per line). Parsed values are kept as written; range checking is
// validateConfig's job.
Settings loadSettings(const std::string& path, std::string* warnings = nullptr);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
