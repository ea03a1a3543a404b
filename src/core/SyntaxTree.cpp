#include "core/SyntaxTree.hpp"

namespace funcscan {

std::string_view to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::MODULE:
            return "module";
        case NodeKind::FUNCTION_DEF:
            return "function_def";
        case NodeKind::ASYNC_FUNCTION_DEF:
            return "async_function_def";
        case NodeKind::CLASS_DEF:
            return "class_def";
        case NodeKind::IMPORT:
            return "import";
        case NodeKind::IMPORT_FROM:
            return "import_from";
        case NodeKind::OTHER:
        default:
            return "other";
    }
}

} // namespace funcscan
