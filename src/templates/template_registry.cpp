#include "template_registry.hpp"
#include <algorithm>

const std::vector<TemplateEntry>& builtin_templates() {
    static const std::vector<TemplateEntry> entries = {
        {"hello_world", "template-hello-world", "hello_world",
            "Minimal FastAPI app with typed CRUD endpoints"},
        {"advanced", "template-advanced", "advanced",
            "FastAPI app with settings, auth, background tasks and a database"},
        {"nlp", "template-nlp", "nlp",
            "Summarization, NER and text generation with transformers"},
        {"langchain", "template-langchain", "langchain_app",
            "LangChain pipeline served over HTTP"},
        {"llama", "template-llama", "llama_app",
            "Local LLM inference with llama.cpp bindings"},
    };
    return entries;
}

std::vector<std::string> list_templates() {
    std::vector<std::string> names;
    names.reserve(builtin_templates().size());
    for (const auto& entry : builtin_templates()) {
        names.push_back(entry.identifier);
    }
    return names;
}

bool is_known_template(const std::string& identifier) {
    const auto& entries = builtin_templates();
    return std::any_of(entries.begin(), entries.end(),
                       [&](const TemplateEntry& e) { return e.identifier == identifier; });
}

TemplateRegistry::TemplateRegistry(const std::vector<TemplateEntry>& entries,
                                   const TemplateLocator& locator) {
    for (const auto& entry : entries) {
        auto location = locator.locate(entry.bundle_name);
        if (!location) {
            missing_[entry.identifier] = entry.bundle_name;
            continue;
        }
        descriptors_[entry.identifier] = TemplateDescriptor{
            entry.identifier,
            *location,
            entry.module_name,
            entry.description,
        };
    }
}

TemplateRegistry TemplateRegistry::builtin(const TemplateLocator& locator) {
    return TemplateRegistry(builtin_templates(), locator);
}

Result<TemplateDescriptor> TemplateRegistry::resolve(const std::string& identifier) const {
    auto it = descriptors_.find(identifier);
    if (it != descriptors_.end()) {
        return Result<TemplateDescriptor>::Ok(it->second);
    }

    auto missing = missing_.find(identifier);
    if (missing != missing_.end()) {
        return Result<TemplateDescriptor>::Err(
            "Template " + identifier + " not found in installation (bundle "
            + missing->second + " is missing)");
    }
    return Result<TemplateDescriptor>::Err("Unknown template: " + identifier);
}
