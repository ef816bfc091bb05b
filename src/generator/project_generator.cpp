#include "project_generator.hpp"
#include "tree_copier.hpp"
#include "identifier_rewriter.hpp"
#include <core/name_validator.hpp>
#include <fmt/format.h>
#include <system_error>

const char* stage_name(GenerationStage stage) {
    switch (stage) {
        case GenerationStage::Validating:          return "validating";
        case GenerationStage::CheckingDestination: return "checking destination";
        case GenerationStage::ResolvingTemplate:   return "resolving template";
        case GenerationStage::Copying:             return "copying";
        case GenerationStage::Rewriting:           return "rewriting";
        case GenerationStage::InitializingVCS:     return "initializing git";
        case GenerationStage::Succeeded:           return "done";
    }
    return "unknown";
}

const char* error_kind_name(GenerationErrorKind kind) {
    switch (kind) {
        case GenerationErrorKind::None:              return "None";
        case GenerationErrorKind::InvalidName:       return "InvalidName";
        case GenerationErrorKind::DestinationExists: return "DestinationExists";
        case GenerationErrorKind::TemplateNotFound:  return "TemplateNotFound";
        case GenerationErrorKind::CopyIOError:       return "CopyIOError";
        case GenerationErrorKind::RewriteIOError:    return "RewriteIOError";
    }
    return "Unknown";
}

ProjectRequest make_project_request(const std::string& project_name,
                                    const std::string& template_identifier,
                                    const fs::path& cwd) {
    ProjectRequest request;
    request.project_name = project_name;
    request.template_identifier = template_identifier;
    request.destination_path = cwd / project_name;
    return request;
}

ProjectGenerator::ProjectGenerator(const TemplateRegistry& registry, GeneratorOptions options)
    : registry_(registry), options_(std::move(options)) {}

void ProjectGenerator::fail(GenerationReport& report, GenerationErrorKind kind,
                            const std::string& error, bool created_destination) const {
    report.error_kind = kind;
    report.error = error;

    if (created_destination && options_.cleanup_on_failure) {
        std::error_code ec;
        fs::remove_all(report.destination, ec);
        report.cleaned_up = !ec;
    }
}

GenerationReport ProjectGenerator::generate(const ProjectRequest& request,
                                            const StatusCallback& on_status) const {
    auto status = [&](const std::string& msg) {
        if (on_status) on_status(msg);
    };

    GenerationReport report;
    report.destination = request.destination_path;

    // ── Validating ──────────────────────────────────────────
    report.stage = GenerationStage::Validating;
    if (!is_valid_project_name(request.project_name)) {
        fail(report, GenerationErrorKind::InvalidName,
             fmt::format("Invalid name {}. Name must match: {}",
                         request.project_name, PROJECT_NAME_PATTERN), false);
        return report;
    }

    // ── CheckingDestination ─────────────────────────────────
    // Must precede every write; copy_tree re-checks atomically
    report.stage = GenerationStage::CheckingDestination;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(request.destination_path, ec))) {
        fail(report, GenerationErrorKind::DestinationExists,
             fmt::format("Folder {} already exists.", request.destination_path.string()), false);
        return report;
    }

    // ── ResolvingTemplate ───────────────────────────────────
    report.stage = GenerationStage::ResolvingTemplate;
    auto resolved = registry_.resolve(request.template_identifier);
    if (resolved.is_err()) {
        fail(report, GenerationErrorKind::TemplateNotFound, resolved.error, false);
        return report;
    }
    report.template_used = resolved.value;
    const TemplateDescriptor& tmpl = resolved.value;

    status(fmt::format("Creating new project: '{}' using template '{}'...",
                       request.project_name, tmpl.identifier));

    // ── Copying ─────────────────────────────────────────────
    report.stage = GenerationStage::Copying;
    status("Copying template files...");
    auto copied = copy_tree(tmpl.bundle_location, request.destination_path,
                            options_.exclude, on_status);
    report.files_copied = copied.files_copied;
    if (copied.destination_exists) {
        // Lost a race with another run; their output is not ours to touch
        report.stage = GenerationStage::CheckingDestination;
        fail(report, GenerationErrorKind::DestinationExists, copied.error, false);
        return report;
    }
    if (copied.is_err()) {
        fail(report, GenerationErrorKind::CopyIOError, copied.error,
             fs::exists(request.destination_path, ec));
        return report;
    }
    status(fmt::format("Copied {} files", copied.files_copied));

    // ── Rewriting ───────────────────────────────────────────
    report.stage = GenerationStage::Rewriting;
    status(fmt::format("Renaming module to '{}'...", request.project_name));
    auto rewritten = rewrite_identifiers(request.destination_path, tmpl.internal_module_name,
                                         request.project_name, on_status);
    if (rewritten.is_err()) {
        fail(report, GenerationErrorKind::RewriteIOError, rewritten.error, true);
        return report;
    }

    // ── InitializingVCS (best-effort) ───────────────────────
    report.stage = GenerationStage::InitializingVCS;
    if (options_.git_init) {
        report.vcs = init_git_repository(request.destination_path, options_.git_program);
        if (!report.vcs.initialized_ok()) {
            status("git init skipped: " + report.vcs.reason);
        }
    } else {
        report.vcs = VcsInitResult::skipped("disabled in config");
    }

    report.stage = GenerationStage::Succeeded;
    return report;
}
