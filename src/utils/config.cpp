#include "utils/config.h"
#include "utils/errors.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>

namespace statlas {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

json yamlToJson(const YAML::Node& n) {
    if (!n || n.IsNull()) return nullptr;
    // Every config value is text; "2024" or "off" must not turn into a number or bool
    if (n.IsScalar()) return n.as<std::string>();
    if (n.IsSequence()) {
        json arr = json::array();
        for (const auto& it : n) arr.push_back(yamlToJson(it));
        return arr;
    }
    json obj = json::object();
    for (auto it = n.begin(); it != n.end(); ++it) {
        obj[it->first.as<std::string>()] = yamlToJson(it->second);
    }
    return obj;
}

const char* envOrNull(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

std::string Config::defaultCacheDir() {
    if (const char* xdg = envOrNull("XDG_CACHE_HOME")) {
        return std::string(xdg) + "/statlas";
    }
    if (const char* home = envOrNull("HOME")) {
        return std::string(home) + "/.cache/statlas";
    }
    return "./.statlas_cache";
}

Config Config::fromJson(const json& j) {
    Config cfg;
    if (!j.is_object()) {
        throw ValidationError("config root must be an object");
    }
    try {
        cfg.base_path = j.value("base_path", cfg.base_path);
        cfg.cache_dir = j.value("cache_dir", cfg.cache_dir);
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            if (l.contains("level")) cfg.log_level = utils::Logger::levelFromString(l["level"].get<std::string>());
            cfg.log_file = l.value("file", cfg.log_file);
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("config: ") + e.what());
    }
    // Paths are joined with "/", a trailing separator would double it
    while (cfg.base_path.size() > 1 && cfg.base_path.back() == '/') {
        cfg.base_path.pop_back();
    }
    return cfg;
}

Config Config::loadFile(const std::string& path) {
    json root;
    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        YAML::Node node;
        try {
            node = YAML::LoadFile(path);
        } catch (const YAML::BadFile& e) {
            throw ResourceError("cannot read config file '" + path + "': " + e.what());
        } catch (const YAML::Exception& e) {
            throw ValidationError("cannot parse config file '" + path + "': " + e.what());
        }
        root = yamlToJson(node);
    } else {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ResourceError("cannot read config file '" + path + "'");
        }
        try {
            f >> root;
        } catch (const json::parse_error& e) {
            throw ValidationError("cannot parse config file '" + path + "': " + e.what());
        }
    }
    STATLAS_DEBUG("Loaded config from {}", path);
    return fromJson(root);
}

Config& Config::applyEnvironment() {
    if (const char* v = envOrNull("STATLAS_BASE_PATH")) base_path = v;
    if (const char* v = envOrNull("STATLAS_CACHE_DIR")) cache_dir = v;
    if (const char* v = envOrNull("STATLAS_LOG_LEVEL")) log_level = utils::Logger::levelFromString(v);
    return *this;
}

json Config::toJson() const {
    return json{
        {"base_path", base_path},
        {"cache_dir", cache_dir},
        {"logging", {
            {"level", utils::Logger::levelToString(log_level)},
            {"file", log_file}
        }}
    };
}

} // namespace statlas
