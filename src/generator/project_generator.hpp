#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <templates/template_registry.hpp>
#include "exclude_filter.hpp"
#include "vcs_init.hpp"

namespace fs = std::filesystem;

// Pipeline states, in order. Failed runs record the stage they stopped in.
enum class GenerationStage {
    Validating,
    CheckingDestination,
    ResolvingTemplate,
    Copying,
    Rewriting,
    InitializingVCS,
    Succeeded,
};

const char* stage_name(GenerationStage stage);
const char* error_kind_name(GenerationErrorKind kind);

struct GeneratorOptions {
    ExcludeFilter exclude;
    bool git_init = true;
    // Remove the destination this run created when copy or rewrite fails.
    // Off by default: partial output helps diagnose the failure.
    bool cleanup_on_failure = false;
    std::string git_program = GIT_PROGRAM;
};

struct GenerationReport {
    GenerationStage stage = GenerationStage::Validating;
    GenerationErrorKind error_kind = GenerationErrorKind::None;
    std::string error;
    fs::path destination;
    std::optional<TemplateDescriptor> template_used;
    size_t files_copied = 0;
    VcsInitResult vcs;
    bool cleaned_up = false;

    bool ok() const { return stage == GenerationStage::Succeeded; }
};

// Build a request with the destination resolved against `cwd`.
ProjectRequest make_project_request(const std::string& project_name,
                                    const std::string& template_identifier,
                                    const fs::path& cwd = fs::current_path());

// Linear pipeline: validate -> check destination -> resolve template ->
// copy -> rewrite -> git init (best-effort). Stateless across calls.
class ProjectGenerator {
public:
    ProjectGenerator(const TemplateRegistry& registry, GeneratorOptions options);

    GenerationReport generate(const ProjectRequest& request,
                              const StatusCallback& on_status = nullptr) const;

private:
    const TemplateRegistry& registry_;
    GeneratorOptions options_;

    void fail(GenerationReport& report, GenerationErrorKind kind,
              const std::string& error, bool created_destination) const;
};
