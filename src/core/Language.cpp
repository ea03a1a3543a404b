#include "Language.hpp"

// Tree-sitter C language parsers
extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace funcscan {

const TSLanguage* LanguageUtils::get_ts_language(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return tree_sitter_python();
        case Language::UNKNOWN:
        default:
            return nullptr;
    }
}

std::string_view LanguageUtils::to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return "python";
        case Language::UNKNOWN:
        default:
            return "unknown";
    }
}

std::vector<std::string_view> LanguageUtils::get_extensions(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return {".py", ".pyi", ".pyw"};
        case Language::UNKNOWN:
        default:
            return {};
    }
}

}  // namespace funcscan
