#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "exclude_filter.hpp"

namespace fs = std::filesystem;

struct CopyResult {
    bool success = false;
    bool destination_exists = false;   // destination was already present; nothing written
    size_t files_copied = 0;
    size_t entries_skipped = 0;        // excluded names and special files
    std::string error;

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Recursively copy `source` to `destination`, which must not exist yet.
// The destination is created with a single create-if-absent call, so two
// concurrent runs can never both write into it. Entries whose name matches
// `filter` are skipped with their subtree. Aborts on the first I/O error and
// leaves whatever was already written in place.
CopyResult copy_tree(const fs::path& source,
                     const fs::path& destination,
                     const ExcludeFilter& filter,
                     const StatusCallback& on_status = nullptr);
