#include "vcs_init.hpp"
#include <core/constants.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

VcsInitResult init_git_repository(const std::filesystem::path& project_dir,
                                  const std::string& git_program) {
    platform::SpawnOptions options;
    options.working_dir = project_dir;
    options.discard_output = true;

    auto proc = platform::spawn(git_program, {"init"}, options);
    if (!proc.valid()) {
        return VcsInitResult::ignored("could not start " + git_program);
    }

    int code = proc.wait(GIT_INIT_TIMEOUT_MS);
    if (code == platform::EXEC_FAILED_EXIT) {
        return VcsInitResult::ignored(git_program + " not found");
    }
    if (code == platform::CHDIR_FAILED_EXIT) {
        return VcsInitResult::ignored("could not enter " + project_dir.string());
    }
    if (code < 0) {
        proc.terminate();
        return VcsInitResult::ignored(git_program + " init did not finish");
    }
    if (code != 0) {
        return VcsInitResult::ignored(fmt::format("{} init exited with code {}", git_program, code));
    }
    return VcsInitResult::initialized();
}
