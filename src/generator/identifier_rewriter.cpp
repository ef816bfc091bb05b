#include "identifier_rewriter.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <vector>
#include <algorithm>
#include <system_error>

namespace {

// Characters that may continue a Python identifier
constexpr const char* WORD = "A-Za-z0-9_";

std::string regex_escape(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

// `$` in a replacement string starts a back-reference
std::string format_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '$') out += '$';
        out += c;
    }
    return out;
}

std::string rewrite_name_field(const std::string& content, const std::string& new_module) {
    static const std::regex name_line(R"re(^([ \t]*name[ \t]*=[ \t]*)"[^"\r\n]*")re");

    std::string out;
    out.reserve(content.size() + new_module.size());
    bool replaced = false;
    size_t pos = 0;

    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        size_t end = (eol == std::string::npos) ? content.size() : eol + 1;
        std::string line = content.substr(pos, end - pos);

        if (!replaced && std::regex_search(line, name_line)) {
            line = std::regex_replace(line, name_line, "$1\"" + format_escape(new_module) + "\"",
                                      std::regex_constants::format_first_only);
            replaced = true;
        }
        out += line;
        pos = end;
    }
    return out;
}

Result<bool> rewrite_file(const fs::path& path,
                          const std::function<std::string(const std::string&)>& transform) {
    auto content = read_text_file(path);
    if (content.is_err()) return Result<bool>::Err(content.error);

    std::string updated = transform(content.value);
    if (updated == content.value) {
        return Result<bool>::Ok(false);
    }

    auto written = write_text_file(path, updated);
    if (written.is_err()) return Result<bool>::Err(written.error);
    return Result<bool>::Ok(true);
}

} // namespace

std::string rewrite_manifest(const std::string& content,
                             const std::string& old_module,
                             const std::string& new_module) {
    std::string out = rewrite_name_field(content, new_module);
    if (old_module == new_module) return out;

    std::string old_re = regex_escape(old_module);
    std::string repl = format_escape(new_module);

    // Entry points: "hello_world.main:run" but not "pkg.hello_world.main"
    std::regex module_prefix(fmt::format("(^|[^{0}.]){1}\\.", WORD, old_re));
    out = std::regex_replace(out, module_prefix, "$1" + repl + ".");

    // Build include paths: packages = ["src/hello_world"]
    std::regex src_path(fmt::format("(^|[^{0}]){1}/{2}(?![{0}])", WORD, SOURCE_ROOT_DIR, old_re));
    out = std::regex_replace(out, src_path, std::string("$1") + SOURCE_ROOT_DIR + "/" + repl);

    return out;
}

std::string rewrite_test_imports(const std::string& content,
                                 const std::string& old_module,
                                 const std::string& new_module) {
    if (old_module == new_module) return content;

    std::string old_re = regex_escape(old_module);
    std::string repl = format_escape(new_module);
    std::string out = content;

    std::regex from_dotted(fmt::format("\\bfrom([ \\t]+){}\\.", old_re));
    out = std::regex_replace(out, from_dotted, "from$1" + repl + ".");

    std::regex from_package(fmt::format("\\bfrom([ \\t]+){}([ \\t]+import\\b)", old_re));
    out = std::regex_replace(out, from_package, "from$1" + repl + "$2");

    std::regex plain_import(fmt::format("\\bimport([ \\t]+){}(?![{}])", old_re, WORD));
    out = std::regex_replace(out, plain_import, "import$1" + repl);

    // mock.patch("hello_world.main.client") style targets
    std::regex quoted_path(fmt::format("([\"']){}\\.", old_re));
    out = std::regex_replace(out, quoted_path, "$1" + repl + ".");

    return out;
}

Result<bool> rename_module_directory(const fs::path& project_dir,
                                     const std::string& old_module,
                                     const std::string& new_module) {
    fs::path old_dir = project_dir / SOURCE_ROOT_DIR / old_module;
    fs::path new_dir = project_dir / SOURCE_ROOT_DIR / new_module;

    std::error_code ec;
    if (old_module == new_module || !fs::is_directory(old_dir, ec)) {
        return Result<bool>::Ok(false);
    }
    if (fs::exists(new_dir, ec)) {
        return Result<bool>::Err(fmt::format("Cannot rename {}: {} already exists",
                                             old_dir.string(), new_dir.string()));
    }

    fs::rename(old_dir, new_dir, ec);
    if (ec) {
        return Result<bool>::Err(fmt::format("Cannot rename {} to {}: {}",
                                             old_dir.string(), new_dir.string(), ec.message()));
    }
    return Result<bool>::Ok(true);
}

Result<void> rewrite_identifiers(const fs::path& project_dir,
                                 const std::string& old_module,
                                 const std::string& new_module,
                                 const StatusCallback& on_status) {
    auto report = [&](const std::string& msg) {
        if (on_status) on_status(msg);
    };

    auto renamed = rename_module_directory(project_dir, old_module, new_module);
    if (renamed.is_err()) return Result<void>::Err(renamed.error);
    if (renamed.value) {
        report(fmt::format("Renamed {}/{} -> {}/{}", SOURCE_ROOT_DIR, old_module,
                           SOURCE_ROOT_DIR, new_module));
    }

    std::error_code ec;
    fs::path manifest = project_dir / MANIFEST_FILENAME;
    if (fs::is_regular_file(manifest, ec)) {
        auto changed = rewrite_file(manifest, [&](const std::string& content) {
            return rewrite_manifest(content, old_module, new_module);
        });
        if (changed.is_err()) return Result<void>::Err(changed.error);
        if (changed.value) report(fmt::format("Updated {}", MANIFEST_FILENAME));
    }

    fs::path tests_dir = project_dir / TESTS_DIR;
    if (!fs::is_directory(tests_dir, ec)) {
        return Result<void>::Ok();
    }

    std::vector<fs::path> test_files;
    fs::directory_iterator it(tests_dir, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename() == TEST_PACKAGE_INIT) continue;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) test_files.push_back(it->path());
    }
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot list {}: {}", tests_dir.string(), ec.message()));
    }
    std::sort(test_files.begin(), test_files.end());

    for (const auto& file : test_files) {
        auto changed = rewrite_file(file, [&](const std::string& content) {
            return rewrite_test_imports(content, old_module, new_module);
        });
        if (changed.is_err()) return Result<void>::Err(changed.error);
        if (changed.value) {
            report(fmt::format("Updated imports in {}/{}", TESTS_DIR, file.filename().string()));
        }
    }

    return Result<void>::Ok();
}
