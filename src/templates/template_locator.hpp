#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// Finds the on-disk root of a bundled template. Read-only collaborator:
// the engine never writes through a located path.
class TemplateLocator {
public:
    virtual ~TemplateLocator() = default;

    // Returns the bundle directory, or nullopt if the bundle is not installed.
    virtual std::optional<fs::path> locate(const std::string& bundle_name) const = 0;
};

// Checks a list of roots in order; the first root containing the bundle wins.
class SearchPathLocator : public TemplateLocator {
public:
    explicit SearchPathLocator(std::vector<fs::path> roots);

    std::optional<fs::path> locate(const std::string& bundle_name) const override;

private:
    std::vector<fs::path> roots_;
};

// Search roots for a normal run: configured dir, $APIGEN_TEMPLATES_DIR,
// the installed share directory next to the executable, then the source tree.
std::vector<fs::path> default_template_roots(const std::optional<fs::path>& configured_dir);
