#pragma once

#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <templates/template_locator.hpp>
#include <generator/project_generator.hpp>

namespace fs = std::filesystem;

struct CliArgs {
    enum class Action { Generate, Version, Help, List };

    Action action = Action::Generate;
    std::string project_name;
    std::optional<std::string> template_identifier;   // nullopt = config default
    bool verbose = false;
};

// Parse arguments (without argv[0]). Err holds a one-line usage error.
Result<CliArgs> parse_cli_args(const std::vector<std::string>& args);

class GeneratorCLI {
public:
    GeneratorCLI(Config config,
                 std::unique_ptr<TemplateLocator> locator,
                 fs::path cwd,
                 std::ostream& out,
                 std::ostream& err);

    // Returns the process exit code.
    int run(const std::vector<std::string>& args);

    void print_usage() const;
    void print_version() const;
    void print_template_list() const;

    // Overrides GeneratorOptions::git_program (tests point it at a missing binary).
    void set_git_program(const std::string& program) { git_program_ = program; }

    // A config load problem. Shown on successful or verbose generation runs, and folded
    // into the single error line otherwise.
    void set_config_warning(const std::string& warning) { config_warning_ = warning; }

private:
    int run_generate(const CliArgs& args);
    void print_success(const std::string& name, const GenerationReport& report) const;
    std::string with_config_note(const std::string& message) const;
    void print_config_warning() const;

    Config config_;
    std::unique_ptr<TemplateLocator> locator_;
    TemplateRegistry registry_;
    fs::path cwd_;
    std::ostream& out_;
    std::ostream& err_;
    std::string git_program_;
    std::string config_warning_;
};
