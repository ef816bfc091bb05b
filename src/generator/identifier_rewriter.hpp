#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Rename the template's module to the project name inside a freshly copied
// project: src/<old> directory, pyproject.toml name and entry points, and
// imports in tests/. Every edit is scoped to `project_dir`. Missing pieces
// (no src/<old>, no manifest, no tests/) are skipped, not errors.
Result<void> rewrite_identifiers(const fs::path& project_dir,
                                 const std::string& old_module,
                                 const std::string& new_module,
                                 const StatusCallback& on_status = nullptr);

// ── Individual steps ────────────────────────────────────────

// src/<old> -> src/<new>. Ok(false) when there is nothing to rename.
Result<bool> rename_module_directory(const fs::path& project_dir,
                                     const std::string& old_module,
                                     const std::string& new_module);

// First `name = "..."` line gets the new name; `<old>.` module prefixes and
// `src/<old>` paths become `<new>.` and `src/<new>`.
std::string rewrite_manifest(const std::string& content,
                             const std::string& old_module,
                             const std::string& new_module);

// `from <old>.`, `from <old> import`, `import <old>` and quoted "<old>.x"
// targets, all on token boundaries.
std::string rewrite_test_imports(const std::string& content,
                                 const std::string& old_module,
                                 const std::string& new_module);
