#pragma once

#include <memory>
#include <string>
#include <string_view>
#include "core/Language.hpp"
#include "core/SyntaxTree.hpp"

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSParser;
    struct TSTree;
    struct TSNode;
}

namespace funcscan {

/**
 * @brief RAII wrapper for TSTree from tree-sitter
 *
 * Manages the lifetime of a TSTree object, ensuring proper cleanup.
 */
class Tree {
public:
    explicit Tree(TSTree* tree);
    ~Tree();

    // Delete copy operations
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    // Move operations
    Tree(Tree&& other) noexcept;
    Tree& operator=(Tree&& other) noexcept;

    /**
     * @brief Get the root node of the syntax tree
     */
    TSNode root_node() const;

    /**
     * @brief Check if the tree has any syntax errors
     */
    bool has_error() const;

private:
    TSTree* tree_;
};

/**
 * @brief RAII parser for Python source code using tree-sitter
 *
 * Wraps the tree-sitter C API. parse() lowers the concrete syntax tree into
 * the parser-neutral SyntaxNode model consumed by the extractors.
 */
class TreeSitterParser : public SourceParser {
public:
    /**
     * @brief Construct a new TreeSitterParser
     * @param lang Programming language to parse (default: PYTHON)
     * @throws std::runtime_error if parser creation fails or language not supported
     */
    explicit TreeSitterParser(Language lang = Language::PYTHON);

    ~TreeSitterParser() override;

    // Delete copy operations
    TreeSitterParser(const TreeSitterParser&) = delete;
    TreeSitterParser& operator=(const TreeSitterParser&) = delete;

    // Move operations
    TreeSitterParser(TreeSitterParser&& other) noexcept;
    TreeSitterParser& operator=(TreeSitterParser&& other) noexcept;

    /**
     * @brief Parse source code from a string
     * @param source Source code to parse
     * @return Unique pointer to parsed tree, or nullptr on error
     */
    std::unique_ptr<Tree> parse_string(std::string_view source);

    /**
     * @brief Parse and lower source text into a SyntaxNode tree
     * @throws ParseError if the tree contains ERROR or missing nodes, or
     *         statements only Python 2 accepts (print, exec)
     */
    SyntaxNode parse(std::string_view source, std::string_view filename) override;

    /**
     * @brief Extract text content of a syntax node
     * @param node The syntax node
     * @param source The source code string
     * @return Text content of the node
     */
    std::string node_text(TSNode node, std::string_view source) const;

private:
    TSParser* parser_;
    std::string last_source_;  // Backing buffer for the most recent tree
};

} // namespace funcscan
