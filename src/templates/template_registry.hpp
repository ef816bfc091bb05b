#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <core/types.hpp>
#include "template_locator.hpp"

// One row of the compiled-in template table.
struct TemplateEntry {
    std::string identifier;     // value of -t/--template
    std::string bundle_name;    // directory under a template root
    std::string module_name;    // package name used inside the bundle
    std::string description;    // for --list / --help
};

// The fixed enumeration shipped with this release.
const std::vector<TemplateEntry>& builtin_templates();

// Identifiers of the builtin table, in enumeration order.
std::vector<std::string> list_templates();

// True if the identifier is part of the builtin enumeration.
bool is_known_template(const std::string& identifier);

// Immutable identifier -> descriptor table, built once at startup and passed
// explicitly to the generator.
class TemplateRegistry {
public:
    TemplateRegistry(const std::vector<TemplateEntry>& entries, const TemplateLocator& locator);

    static TemplateRegistry builtin(const TemplateLocator& locator);

    // Exact-match lookup. Err distinguishes an unknown identifier from an
    // enumerated template whose bundle is missing from the installation.
    Result<TemplateDescriptor> resolve(const std::string& identifier) const;

    size_t size() const { return descriptors_.size(); }

private:
    std::unordered_map<std::string, TemplateDescriptor> descriptors_;
    std::unordered_map<std::string, std::string> missing_;  // identifier -> bundle name
};
