#pragma once

#include "core/SyntaxTree.hpp"
#include <string>
#include <vector>

namespace funcscan {

/**
 * @brief Collects every import in a file as normalized one-line text
 *
 * Walks the whole tree, at any depth, in document order:
 *   import a.b            -> "import a.b"
 *   import a as b, c      -> "import a as b", "import c"
 *   from m import x as y, z -> "from m import x as y, z"
 *   from . import x       -> "from  import x"
 */
class ImportCollector {
public:
    static std::vector<std::string> collect(const SyntaxNode& root);

    /**
     * @brief Render a single IMPORT or IMPORT_FROM node
     * @return One line per name for IMPORT, exactly one line for IMPORT_FROM
     */
    static std::vector<std::string> render(const SyntaxNode& node);

private:
    static void walk(const SyntaxNode& node, std::vector<std::string>& out);
};

} // namespace funcscan
