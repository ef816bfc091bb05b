#include "generator_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/name_validator.hpp>
#include <templates/template_registry.hpp>
#include <fmt/format.h>

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

Result<CliArgs> parse_cli_args(const std::vector<std::string>& args) {
    CliArgs parsed;
    bool have_name = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--version") {
            parsed.action = CliArgs::Action::Version;
            return Result<CliArgs>::Ok(parsed);
        } else if (arg == "--help" || arg == "-h") {
            parsed.action = CliArgs::Action::Help;
            return Result<CliArgs>::Ok(parsed);
        } else if (arg == "--list") {
            parsed.action = CliArgs::Action::List;
        } else if (arg == "-v" || arg == "--verbose") {
            parsed.verbose = true;
        } else if (arg == "-t" || arg == "--template") {
            if (i + 1 >= args.size()) {
                return Result<CliArgs>::Err("Option " + arg + " requires an argument.");
            }
            parsed.template_identifier = args[++i];
        } else if (starts_with(arg, "--template=")) {
            parsed.template_identifier = arg.substr(std::string("--template=").size());
        } else if (arg == "--") {
            // Everything after is positional
            for (++i; i < args.size(); i++) {
                if (have_name) return Result<CliArgs>::Err("Got unexpected extra argument (" + args[i] + ")");
                parsed.project_name = args[i];
                have_name = true;
            }
        } else if (starts_with(arg, "-") && arg.size() > 1) {
            return Result<CliArgs>::Err("No such option: " + arg);
        } else {
            if (have_name) {
                return Result<CliArgs>::Err("Got unexpected extra argument (" + arg + ")");
            }
            parsed.project_name = arg;
            have_name = true;
        }
    }

    if (parsed.action == CliArgs::Action::Generate && !have_name) {
        return Result<CliArgs>::Err("Missing argument 'NAME'.");
    }
    return Result<CliArgs>::Ok(parsed);
}

GeneratorCLI::GeneratorCLI(Config config,
                           std::unique_ptr<TemplateLocator> locator,
                           fs::path cwd,
                           std::ostream& out,
                           std::ostream& err)
    : config_(std::move(config)),
      locator_(std::move(locator)),
      registry_(TemplateRegistry::builtin(*locator_)),
      cwd_(std::move(cwd)),
      out_(out),
      err_(err),
      git_program_(GIT_PROGRAM) {}

void GeneratorCLI::print_usage() const {
    out_ << theme::banner(APIGEN_VERSION);
    out_ << theme::section("Usage");
    out_ << "    " << theme::blue("apigen") << " [-t TEMPLATE] [-v] NAME\n\n";
    out_ << theme::dim("    Creates a new FastAPI project in ./NAME using TEMPLATE.") << "\n";
    out_ << theme::dim(fmt::format("    NAME must match {}.", PROJECT_NAME_PATTERN)) << "\n";
    out_ << theme::section("Options");
    out_ << theme::kv("-t, --template", fmt::format("One of: {} (default: {})",
                                                    join(list_templates(), ", "),
                                                    config_.default_template()));
    out_ << theme::kv("-v, --verbose", "Show each step");
    out_ << theme::kv("--list", "List templates and exit");
    out_ << theme::kv("--version", "Show version and exit");
    out_ << theme::kv("--help", "Show this help and exit");
    out_ << "\n";
}

void GeneratorCLI::print_version() const {
    out_ << "apigen version " << APIGEN_VERSION << "\n";
}

void GeneratorCLI::print_template_list() const {
    out_ << theme::section("Templates");
    for (const auto& entry : builtin_templates()) {
        std::string marker = entry.identifier == config_.default_template() ? " (default)" : "";
        out_ << theme::kv(entry.identifier, entry.description + theme::dim(marker));
    }
    out_ << "\n";
}

std::string GeneratorCLI::with_config_note(const std::string& message) const {
    if (config_warning_.empty()) return message;
    return message + " (" + config_warning_ + "; defaults used)";
}

void GeneratorCLI::print_config_warning() const {
    if (!config_warning_.empty()) {
        err_ << theme::info(config_warning_ + "; using defaults");
    }
}

int GeneratorCLI::run(const std::vector<std::string>& args) {
    auto parsed = parse_cli_args(args);
    if (parsed.is_err()) {
        err_ << theme::fail(with_config_note("Error. " + parsed.error + " Try 'apigen --help'."));
        return EXIT_FAILURE_CODE;
    }

    switch (parsed.value.action) {
        case CliArgs::Action::Version:
            print_version();
            return EXIT_OK;
        case CliArgs::Action::Help:
            print_usage();
            return EXIT_OK;
        case CliArgs::Action::List:
            print_template_list();
            return EXIT_OK;
        case CliArgs::Action::Generate:
            break;
    }
    return run_generate(parsed.value);
}

int GeneratorCLI::run_generate(const CliArgs& args) {
    std::string template_id = args.template_identifier.value_or(config_.default_template());

    // Unknown ids never reach the filesystem
    if (!is_known_template(template_id)) {
        err_ << theme::fail(with_config_note(fmt::format(
            "Error while {}: Unknown template: {} (available: {})",
            stage_name(GenerationStage::ResolvingTemplate), template_id,
            join(list_templates(), ", "))));
        return EXIT_FAILURE_CODE;
    }

    GeneratorOptions options;
    for (const auto& pattern : config_.exclude()) {
        options.exclude.add_pattern(pattern);
    }
    options.git_init = config_.git_init();
    options.cleanup_on_failure = config_.cleanup_on_failure();
    options.git_program = git_program_;

    ProjectGenerator generator(registry_, std::move(options));

    StatusCallback on_status = nullptr;
    if (args.verbose) {
        print_config_warning();
        on_status = [this](const std::string& msg) { err_ << theme::log(msg); };
    }

    auto request = make_project_request(args.project_name, template_id, cwd_);
    auto report = generator.generate(request, on_status);

    if (!report.ok()) {
        std::string message = report.error;
        if (report.cleaned_up) {
            message += " Removed partial output.";
        }
        err_ << theme::fail(with_config_note(
            fmt::format("Error while {}: {}", stage_name(report.stage), message)));
        return EXIT_FAILURE_CODE;
    }

    if (!args.verbose) print_config_warning();
    print_success(args.project_name, report);
    return EXIT_OK;
}

void GeneratorCLI::print_success(const std::string& name, const GenerationReport& report) const {
    out_ << "\n" << theme::green("Success!") << " Created " << name
         << " at " << report.destination.string() << "\n";

    out_ << theme::section("Inside that directory, you can run several commands:");
    out_ << theme::command("make install", "Install dependencies");
    out_ << theme::command("make start", "Start the development server");
    out_ << theme::command("make test", "Run tests");
    out_ << theme::command("make lint", "Run linter");

    out_ << "  We suggest that you begin by typing:\n\n";
    out_ << "    " << theme::blue("cd " + name) << "\n";
    out_ << "    " << theme::blue("make install") << "\n";
    out_ << "    " << theme::blue("make start") << "\n\n";

    out_ << "  Then open " << theme::cyan("http://localhost:8000/docs") << " to see your API.\n\n";
    out_ << "  " << theme::yellow("Happy hacking!") << "\n\n";
}
