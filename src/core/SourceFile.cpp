#include "core/SourceFile.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace funcscan {

namespace {

std::string normalize_newlines(std::string text) {
    if (text.find('\r') == std::string::npos) {
        return text;
    }

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

} // namespace

std::vector<std::string> split_lines_keep_ends(std::string_view text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    while (begin < text.size()) {
        size_t nl = text.find('\n', begin);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(begin));
            break;
        }
        lines.emplace_back(text.substr(begin, nl - begin + 1));
        begin = nl + 1;
    }
    return lines;
}

SourceFile::SourceFile(std::string text, std::filesystem::path path)
    : path_(std::move(path)),
      text_(normalize_newlines(std::move(text))),
      lines_(split_lines_keep_ends(text_)) {
}

SourceFile SourceFile::load(const std::filesystem::path& filepath) {
    std::error_code ec;
    if (std::filesystem::is_directory(filepath, ec)) {
        throw IOError("Failed to open file: " + filepath.string() + ": Is a directory");
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open file: " + filepath.string() + ": " +
                      std::strerror(errno));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IOError("Failed to read file: " + filepath.string());
    }

    spdlog::debug("Loaded {} ({} bytes)", filepath.string(), buffer.str().size());

    return SourceFile(buffer.str(), filepath);
}

std::string slice_lines(const std::vector<std::string>& lines,
                        uint32_t start_line,
                        uint32_t end_line) {
    if (start_line == 0) {
        start_line = 1;
    }
    if (end_line > lines.size()) {
        end_line = static_cast<uint32_t>(lines.size());
    }

    std::string out;
    for (uint32_t line = start_line; line <= end_line; ++line) {
        out += lines[line - 1];
    }
    return out;
}

} // namespace funcscan
