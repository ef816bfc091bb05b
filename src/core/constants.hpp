#pragma once

#ifndef APIGEN_VERSION
#define APIGEN_VERSION "0.0.0-dev"
#endif

// ── Templates ───────────────────────────────────────────────
constexpr const char* DEFAULT_TEMPLATE        = "hello_world";
constexpr const char* TEMPLATES_DIR_ENV       = "APIGEN_TEMPLATES_DIR";
constexpr const char* INSTALLED_TEMPLATES_REL = "../share/apigen/templates";

// ── Generated project layout ────────────────────────────────
constexpr const char* MANIFEST_FILENAME  = "pyproject.toml";
constexpr const char* SOURCE_ROOT_DIR    = "src";
constexpr const char* TESTS_DIR          = "tests";
constexpr const char* TEST_PACKAGE_INIT  = "__init__.py";

// ── Copy exclusions ─────────────────────────────────────────
// Build and cache artifacts that must never leak from a bundle into a project.
constexpr const char* DEFAULT_EXCLUDES[] = {
    "__pycache__",
    ".pytest_cache",
    ".ruff_cache",
    ".mypy_cache",
    ".venv",
    "venv",
    ".git",
    "uv.lock",
    "*.pyc",
    ".DS_Store",
};

// ── VCS ─────────────────────────────────────────────────────
constexpr const char* GIT_PROGRAM         = "git";
constexpr int GIT_INIT_TIMEOUT_MS         = 30000;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK      = 0;
constexpr int EXIT_FAILURE_CODE = 1;
