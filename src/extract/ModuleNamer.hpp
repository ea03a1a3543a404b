#pragma once

#include <string>
#include <string_view>

namespace funcscan {

/**
 * @brief Derives a bare module identifier from a file path
 *
 * "a/b/widget.py" and "a\\b\\widget.py" both yield "widget" regardless of
 * the host platform's separator.
 */
class ModuleNamer {
public:
    static std::string module_name(std::string_view path);

    /**
     * @brief Remove a trailing Python source extension, if any
     */
    static std::string_view strip_extension(std::string_view path);
};

} // namespace funcscan
