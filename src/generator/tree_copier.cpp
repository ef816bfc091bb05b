#include "tree_copier.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <vector>
#include <system_error>

namespace {

struct CopyContext {
    const ExcludeFilter& filter;
    const StatusCallback& on_status;
    CopyResult& result;
};

bool fail(CopyContext& ctx, const std::string& what, const fs::path& path, const std::error_code& ec) {
    ctx.result.success = false;
    ctx.result.error = fmt::format("{} {}: {}", what, path.string(), ec.message());
    return false;
}

// Sorted so copy order (and the first reported error) is deterministic
bool list_directory(CopyContext& ctx, const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return fail(ctx, "Cannot list", dir, ec);

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        out.push_back(it->path());
    }
    if (ec) return fail(ctx, "Cannot list", dir, ec);

    std::sort(out.begin(), out.end());
    return true;
}

bool copy_file_with_mode(CopyContext& ctx, const fs::path& src, const fs::path& dst,
                         fs::perms mode) {
    std::error_code ec;
    if (!fs::copy_file(src, dst, fs::copy_options::none, ec)) {
        return fail(ctx, "Cannot copy", src, ec);
    }
    // Keep executable bits (scripts, gradle-style wrappers)
    fs::permissions(dst, mode, fs::perm_options::replace, ec);
    if (ec) return fail(ctx, "Cannot set permissions on", dst, ec);

    ctx.result.files_copied++;
    return true;
}

bool copy_directory(CopyContext& ctx, const fs::path& src, const fs::path& dst) {
    std::vector<fs::path> entries;
    if (!list_directory(ctx, src, entries)) return false;

    for (const auto& entry : entries) {
        std::string name = entry.filename().string();
        if (ctx.filter.is_excluded(name)) {
            ctx.result.entries_skipped++;
            if (ctx.on_status) ctx.on_status("Skipped " + entry.string());
            continue;
        }

        // Follows symlinks; a dangling link surfaces here as not_found
        std::error_code ec;
        fs::file_status st = fs::status(entry, ec);
        if (ec || !fs::exists(st)) {
            if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return fail(ctx, "Cannot read", entry, ec);
        }

        fs::path target = dst / entry.filename();
        if (fs::is_directory(st)) {
            if (!fs::create_directory(target, ec) || ec) {
                if (!ec) ec = std::make_error_code(std::errc::file_exists);
                return fail(ctx, "Cannot create directory", target, ec);
            }
            if (!copy_directory(ctx, entry, target)) return false;
        } else if (fs::is_regular_file(st)) {
            if (!copy_file_with_mode(ctx, entry, target, st.permissions())) return false;
        } else {
            // Sockets, fifos and devices have no place in a template
            ctx.result.entries_skipped++;
        }
    }
    return true;
}

} // namespace

CopyResult copy_tree(const fs::path& source,
                     const fs::path& destination,
                     const ExcludeFilter& filter,
                     const StatusCallback& on_status) {
    CopyResult result;
    CopyContext ctx{filter, on_status, result};

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::not_a_directory);
        fail(ctx, "Template source is not a directory:", source, ec);
        return result;
    }

    if (!fs::create_directory(destination, ec)) {
        if (ec) {
            fail(ctx, "Cannot create", destination, ec);
        } else {
            result.destination_exists = true;
            result.error = fmt::format("Folder {} already exists.", destination.string());
        }
        return result;
    }

    result.success = true;
    copy_directory(ctx, source, destination);
    return result;
}
