#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace funcscan {

/**
 * @brief Node kinds the extractors care about
 *
 * Everything else in the concrete tree is lowered to OTHER, keeping its
 * children so deep walks still reach nested imports.
 */
enum class NodeKind {
    MODULE,
    FUNCTION_DEF,
    ASYNC_FUNCTION_DEF,
    CLASS_DEF,
    IMPORT,
    IMPORT_FROM,
    OTHER
};

/**
 * @brief One imported name, optionally renamed with `as`
 */
struct ImportAlias {
    std::string name;
    std::string asname;  // Empty when no alias is given
};

/**
 * @brief Parser-neutral syntax node
 *
 * Owns its children. Lines are 1-based and inclusive.
 */
struct SyntaxNode {
    NodeKind kind = NodeKind::OTHER;
    std::string name;                   // Function or class name
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    std::string module;                 // IMPORT_FROM only, may be empty
    std::vector<ImportAlias> aliases;   // IMPORT and IMPORT_FROM
    std::vector<SyntaxNode> children;   // Direct children in source order

    bool is_function() const {
        return kind == NodeKind::FUNCTION_DEF || kind == NodeKind::ASYNC_FUNCTION_DEF;
    }
};

/**
 * @brief Turns source text into a SyntaxNode tree
 *
 * Implementations throw ParseError when the text is not valid.
 */
class SourceParser {
public:
    virtual ~SourceParser() = default;

    /**
     * @brief Parse source text
     * @param source Full source text
     * @param filename Name used in diagnostics
     * @return Root node (kind MODULE)
     * @throws ParseError on invalid syntax
     */
    virtual SyntaxNode parse(std::string_view source, std::string_view filename) = 0;
};

std::string_view to_string(NodeKind kind);

} // namespace funcscan
