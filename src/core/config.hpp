#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace YAML { class Node; }

namespace fs = std::filesystem;

class Config {
public:
    // Load user config from ~/.apigen/config.yaml. Missing file yields defaults.
    static Result<Config> load_global();

    // Load from an explicit path. Missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& default_template() const { return default_template_; }
    const std::optional<fs::path>& templates_dir() const { return templates_dir_; }
    bool git_init() const { return git_init_; }
    bool cleanup_on_failure() const { return cleanup_on_failure_; }
    const std::vector<std::string>& exclude() const { return exclude_; }

public:
    Config();

private:
    static Config from_yaml(const YAML::Node& root);

    std::string default_template_;
    std::optional<fs::path> templates_dir_;
    bool git_init_ = true;
    bool cleanup_on_failure_ = false;
    std::vector<std::string> exclude_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
