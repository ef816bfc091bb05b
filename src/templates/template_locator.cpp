#include "template_locator.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <system_error>

SearchPathLocator::SearchPathLocator(std::vector<fs::path> roots)
    : roots_(std::move(roots)) {}

std::optional<fs::path> SearchPathLocator::locate(const std::string& bundle_name) const {
    for (const auto& root : roots_) {
        std::error_code ec;
        fs::path candidate = root / bundle_name;
        if (fs::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<fs::path> default_template_roots(const std::optional<fs::path>& configured_dir) {
    std::vector<fs::path> roots;

    if (configured_dir) {
        roots.push_back(*configured_dir);
    }
    if (auto env = platform::getenv_nonempty(TEMPLATES_DIR_ENV)) {
        roots.push_back(fs::path(*env));
    }
    if (auto exe_dir = platform::executable_dir()) {
        roots.push_back((*exe_dir / INSTALLED_TEMPLATES_REL).lexically_normal());
    }
#ifdef APIGEN_SOURCE_BUNDLES_DIR
    // Development mode: run straight from a build tree
    roots.push_back(fs::path(APIGEN_SOURCE_BUNDLES_DIR));
#endif

    return roots;
}
