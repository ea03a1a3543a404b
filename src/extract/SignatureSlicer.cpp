#include "extract/SignatureSlicer.hpp"
#include "core/SourceFile.hpp"
#include <algorithm>

namespace funcscan {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string_view SignatureSlicer::rtrim(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(0, end);
}

std::string_view SignatureSlicer::strip_comment(std::string_view line) {
    size_t hash = line.find('#');
    if (hash == std::string_view::npos) {
        return line;
    }
    return line.substr(0, hash);
}

bool SignatureSlicer::ends_header(std::string_view line) {
    std::string_view code = rtrim(strip_comment(line));
    return !code.empty() && code.back() == ':';
}

SlicedFunction SignatureSlicer::slice(const std::vector<std::string>& lines,
                                      uint32_t start_line,
                                      uint32_t end_line) {
    SlicedFunction result;
    result.signature_terminated = false;
    result.body = slice_lines(lines, start_line, end_line);

    uint32_t first = std::max<uint32_t>(start_line, 1);
    uint32_t last = std::min<uint32_t>(end_line, static_cast<uint32_t>(lines.size()));

    std::string header;
    for (uint32_t line = first; line <= last && !result.signature_terminated; ++line) {
        const std::string& text = lines[line - 1];
        if (ends_header(text)) {
            // The terminating line contributes only its code, not its comment
            header += rtrim(strip_comment(text));
            result.signature_terminated = true;
        } else {
            header += text;
        }
    }

    result.signature = std::string(rtrim(header));
    return result;
}

} // namespace funcscan
