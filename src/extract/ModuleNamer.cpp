#include "extract/ModuleNamer.hpp"
#include "core/Language.hpp"

namespace funcscan {

std::string_view ModuleNamer::strip_extension(std::string_view path) {
    for (auto ext : LanguageUtils::get_extensions(Language::PYTHON)) {
        if (path.size() >= ext.size() &&
            path.compare(path.size() - ext.size(), ext.size(), ext) == 0) {
            return path.substr(0, path.size() - ext.size());
        }
    }
    return path;
}

std::string ModuleNamer::module_name(std::string_view path) {
    size_t sep = path.find_last_of("/\\");
    std::string_view last = sep == std::string_view::npos ? path : path.substr(sep + 1);
    if (!last.empty()) {
        return std::string(strip_extension(last));
    }

    // No final segment (e.g. a trailing separator): flatten the whole path
    std::string flat(strip_extension(path));
    for (char& c : flat) {
        if (c == '/' || c == '\\') {
            c = '.';
        }
    }
    return flat;
}

} // namespace funcscan
