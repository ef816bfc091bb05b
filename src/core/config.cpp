#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".apigen";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Config::Config() : default_template_(DEFAULT_TEMPLATE) {}

// Present-but-mistyped keys throw instead of silently falling back
template <typename T>
static T read_key(const YAML::Node& root, const char* key, const T& fallback) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) return fallback;
    return node.as<T>();
}

// Throws on type mismatches; callers convert to Result.
Config Config::from_yaml(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a mapping");
    }

    config.default_template_ = read_key<std::string>(root, "default_template", DEFAULT_TEMPLATE);
    std::string templates_dir = read_key<std::string>(root, "templates_dir", "");
    if (!templates_dir.empty()) {
        config.templates_dir_ = fs::path(templates_dir);
    }
    config.git_init_ = read_key<bool>(root, "git_init", true);
    config.cleanup_on_failure_ = read_key<bool>(root, "cleanup_on_failure", false);

    // Accept either a single pattern or a list
    const YAML::Node exclude = root["exclude"];
    if (exclude && exclude.IsScalar()) {
        config.exclude_.push_back(exclude.as<std::string>());
    } else if (exclude && !exclude.IsNull()) {
        config.exclude_ = exclude.as<std::vector<std::string>>();
    }

    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return Result<Config>::Ok(from_yaml(YAML::Load(yaml_text)));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config());
    }

    try {
        return Result<Config>::Ok(from_yaml(YAML::LoadFile(path.string())));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}
