#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>

Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot read " + path.string() + ": " + std::strerror(errno));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Err("Read failed for " + path.string());
    }
    return Result<std::string>::Ok(ss.str());
}

Result<void> write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write " + path.string() + ": " + std::strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        return Result<void>::Err("Write failed for " + path.string());
    }
    return Result<void>::Ok();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}
