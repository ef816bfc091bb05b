#pragma once

#include <string>
#include <utility>
#include <vector>
#include <functional>
#include <filesystem>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Fatal generation failures. VCS init is never one of these; see VcsInitResult.
enum class GenerationErrorKind {
    None,
    InvalidName,
    DestinationExists,
    TemplateNotFound,
    CopyIOError,
    RewriteIOError,
};

// One installable template, resolved against the installation.
struct TemplateDescriptor {
    std::string identifier;              // "hello_world", "llama", ...
    std::filesystem::path bundle_location;  // read-only, never mutated
    std::string internal_module_name;    // placeholder module baked into the bundle
    std::string description;
};

// One invocation of the generator.
struct ProjectRequest {
    std::string project_name;
    std::string template_identifier;
    std::filesystem::path destination_path;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
