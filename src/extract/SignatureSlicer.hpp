#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace funcscan {

/**
 * @brief Declaration header and full text of one function
 */
struct SlicedFunction {
    std::string signature;
    std::string body;
    bool signature_terminated = true;  // false when the colon scan ran off the span
};

/**
 * @brief Line-oriented reconstruction of function headers
 *
 * Works on raw text only, independent of any syntax tree.
 */
class SignatureSlicer {
public:
    /**
     * @brief Slice signature and body for lines start..end (1-based, inclusive)
     *
     * The signature accumulates lines up to the first one that ends_header(),
     * with that line's trailing comment dropped. Without such a line it runs
     * to end_line.
     *
     * @param lines Source lines with terminators
     */
    static SlicedFunction slice(const std::vector<std::string>& lines,
                                uint32_t start_line,
                                uint32_t end_line);

    /**
     * @brief True if the line, with any '#' comment removed and trailing
     *        whitespace trimmed, ends with ':'
     */
    static bool ends_header(std::string_view line);

    /**
     * @brief Strip a trailing '#' comment (the first '#' on the line)
     */
    static std::string_view strip_comment(std::string_view line);

    static std::string_view rtrim(std::string_view text);
};

} // namespace funcscan
