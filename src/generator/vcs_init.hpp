#pragma once

#include <string>
#include <filesystem>
#include <core/constants.hpp>

// Outcome of the best-effort repository bootstrap. Never an error: the
// generator reports success whatever the status is.
struct VcsInitResult {
    enum class Status { Initialized, Skipped, Ignored };

    Status status = Status::Skipped;
    std::string reason;   // why it was skipped or ignored

    static VcsInitResult initialized() { return {Status::Initialized, ""}; }
    static VcsInitResult skipped(const std::string& why) { return {Status::Skipped, why}; }
    static VcsInitResult ignored(const std::string& why) { return {Status::Ignored, why}; }

    bool initialized_ok() const { return status == Status::Initialized; }
};

// Run `git init` inside `project_dir` with output discarded.
VcsInitResult init_git_repository(const std::filesystem::path& project_dir,
                                  const std::string& git_program = GIT_PROGRAM);
