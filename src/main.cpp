#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include "cli/generator_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <templates/template_locator.hpp>

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        // A broken config file must not block generation
        auto config_result = Config::load_global();
        Config config;
        if (config_result.is_ok()) {
            config = config_result.value;
        }

        auto locator = std::make_unique<SearchPathLocator>(
            default_template_roots(config.templates_dir()));

        GeneratorCLI cli(config, std::move(locator), std::filesystem::current_path(),
                         std::cout, std::cerr);
        if (config_result.is_err()) {
            cli.set_config_warning(config_result.error);
        }
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string("Error. ") + e.what());
        return EXIT_FAILURE_CODE;
    }
}
