#pragma once

#include "utils/logger.h"

#include <nlohmann/json.hpp>
#include <string>

namespace statlas {

using json = nlohmann::json;

/// Published release the catalog is read from unless configured otherwise
inline constexpr const char* kDefaultBasePath = "https://popgetter.blob.core.windows.net/releases/v0.2";

/**
 * @brief Runtime configuration of the catalog and download engine
 *
 * File layout (JSON or YAML):
 *   base_path: https://... | /local/dir
 *   cache_dir: /path/to/cache
 *   logging:
 *     level: info
 *     file: statlas.log
 */
struct Config {
    std::string base_path = kDefaultBasePath;
    std::string cache_dir = defaultCacheDir();
    utils::Logger::Level log_level = utils::Logger::Level::INFO;
    std::string log_file;

    /**
     * @brief $XDG_CACHE_HOME/statlas, else $HOME/.cache/statlas, else ./.statlas_cache
     */
    static std::string defaultCacheDir();

    /**
     * @brief Build from a JSON object; keys that are absent keep their defaults
     * @throws ValidationError on wrongly typed values
     */
    static Config fromJson(const json& j);

    /**
     * @brief Load a JSON or YAML file (chosen by extension: .yaml/.yml vs. anything else)
     * @throws ResourceError if the file cannot be read, ValidationError if it cannot be parsed
     */
    static Config loadFile(const std::string& path);

    /**
     * @brief Override fields from STATLAS_BASE_PATH, STATLAS_CACHE_DIR and STATLAS_LOG_LEVEL
     */
    Config& applyEnvironment();

    json toJson() const;

    bool operator==(const Config& other) const {
        return base_path == other.base_path && cache_dir == other.cache_dir &&
               log_level == other.log_level && log_file == other.log_file;
    }
    bool operator!=(const Config& other) const { return !(*this == other); }
};

} // namespace statlas
