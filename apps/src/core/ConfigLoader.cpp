#include "ConfigLoader.h"
#include "LoggingChannels.h"

#include <cstdlib>
#include <fstream>

namespace AgentEvo {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "agentevo");
    }

    paths.push_back(fs::path("/etc/agentevo"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    const auto existingFile = [](const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    };

    if (fs::path(filename).has_parent_path()) {
        const fs::path direct(filename);
        const fs::path local(filename + ".local");
        if (existingFile(local)) {
            return local;
        }
        if (existingFile(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    for (const auto& dir : getSearchPaths()) {
        const fs::path localPath = dir / (filename + ".local");
        if (existingFile(localPath)) {
            return localPath;
        }

        const fs::path basePath = dir / filename;
        if (existingFile(basePath)) {
            return basePath;
        }
    }

    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    try {
        if (fs::file_size(path) == 0) {
            const std::string error = "Empty config file: " + path.string();
            LOG_WARN(Config, "{}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            const std::string error = "Cannot open config file: " + path.string();
            LOG_WARN(Config, "{}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        const std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
    catch (const std::exception& e) {
        const std::string error = "Error reading " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        const std::string error = "Config file not found: " + filename;
        LOG_DEBUG(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    LOG_INFO(Config, "Loading config from {}", path->string());
    return tryLoadJson(path.value());
}

} // namespace AgentEvo
