#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace AgentEvo {

/**
 * @brief Loads JSON configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/
 * 3. ~/.config/agentevo/
 * 4. /etc/agentevo/
 *
 * At each location the .local version (e.g. evolution.json.local) is checked before the
 * base file. The .local file replaces the base file, it is not merged.
 *
 * A filename containing a directory separator is treated as a path and loaded directly.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Unqualified call so ADL finds the from_json next to T.
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

} // namespace AgentEvo
