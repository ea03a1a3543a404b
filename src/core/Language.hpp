#pragma once

#include <string>
#include <string_view>
#include <vector>

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSLanguage;
}

namespace funcscan {

/**
 * @brief Source languages funcscan knows how to extract from
 */
enum class Language {
    PYTHON,   // Python language
    UNKNOWN   // Unknown or unsupported language
};

/**
 * @brief Language utilities for the tree-sitter grammar registry
 */
class LanguageUtils {
public:
    /**
     * @brief Get tree-sitter TSLanguage for the given language
     *
     * @return Pointer to TSLanguage or nullptr if not supported
     */
    static const TSLanguage* get_ts_language(Language lang);

    /**
     * @brief Convert Language enum to string name ("python", "unknown")
     */
    static std::string_view to_string(Language lang);

    /**
     * @brief Get file extensions for a language
     *
     * @param lang Language enum value
     * @return Vector of file extensions (including dot, e.g., ".py")
     */
    static std::vector<std::string_view> get_extensions(Language lang);
};

}  // namespace funcscan
