#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace funcscan {

/**
 * @brief Immutable source text with a line-indexed view
 *
 * Lines keep their terminators, so joining lines [a-1, b) reproduces the
 * exact text of the 1-based inclusive range a..b.
 */
class SourceFile {
public:
    /**
     * @brief Build from in-memory text
     * @param text Source text; CRLF and CR are normalized to LF
     * @param path Path used for diagnostics and module naming
     */
    explicit SourceFile(std::string text, std::filesystem::path path = {});

    /**
     * @brief Load a file from disk
     * @throws IOError if the file cannot be opened or read
     */
    static SourceFile load(const std::filesystem::path& filepath);

    const std::string& text() const { return text_; }
    const std::filesystem::path& path() const { return path_; }
    const std::vector<std::string>& lines() const { return lines_; }
    size_t line_count() const { return lines_.size(); }

private:
    std::filesystem::path path_;
    std::string text_;
    std::vector<std::string> lines_;
};

/**
 * @brief Split text on '\n', keeping the terminator on each line
 */
std::vector<std::string> split_lines_keep_ends(std::string_view text);

/**
 * @brief Concatenate lines start..end (1-based, inclusive)
 *
 * Out-of-range bounds are clamped to the available lines.
 */
std::string slice_lines(const std::vector<std::string>& lines,
                        uint32_t start_line,
                        uint32_t end_line);

} // namespace funcscan
