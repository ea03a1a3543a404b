#include "core/TreeSitterParser.hpp"
#include "core/Errors.hpp"
#include "core/Language.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>
#include <vector>

// Tree-sitter C API
extern "C" {
    #include <tree_sitter/api.h>
}

namespace funcscan {

// ============================================================================
// Tree implementation
// ============================================================================

Tree::Tree(TSTree* tree) : tree_(tree) {
    if (!tree_) {
        throw std::invalid_argument("Cannot create Tree with nullptr");
    }
}

Tree::~Tree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

Tree::Tree(Tree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

Tree& Tree::operator=(Tree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

TSNode Tree::root_node() const {
    return ts_tree_root_node(tree_);
}

bool Tree::has_error() const {
    TSNode root = root_node();
    return ts_node_has_error(root);
}

// ============================================================================
// Lowering from tree-sitter-python nodes to SyntaxNode
// ============================================================================

namespace {

bool is_type(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

uint32_t start_line_of(TSNode node) {
    return ts_node_start_point(node).row + 1;
}

uint32_t end_line_of(TSNode node) {
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    // A span that stops at column 0 ends on the previous line
    if (end.column == 0 && end.row > start.row) {
        return end.row;
    }
    return end.row + 1;
}

/**
 * @brief Last line holding code, ignoring comments that trail a block
 *
 * tree-sitter keeps a comment indented like the last statement inside the
 * enclosing block, so the raw node span would include it.
 */
uint32_t content_end_line(TSNode node) {
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = count; i > 0; --i) {
        TSNode child = ts_node_child(node, i - 1);
        if (is_type(child, "comment")) {
            continue;
        }
        if (!ts_node_is_named(child)) {
            // Closing token such as ']' or ')'
            return end_line_of(child);
        }
        return content_end_line(child);
    }
    return end_line_of(node);
}

// Statements tree-sitter-python accepts but Python 3 rejects
bool is_python2_only(TSNode node) {
    return is_type(node, "print_statement") || is_type(node, "exec_statement");
}

/**
 * @brief First ERROR, missing or Python 2 only node in document order
 */
bool find_first_error(TSNode node, TSNode& found) {
    if (ts_node_is_missing(node) || is_type(node, "ERROR") || is_python2_only(node)) {
        found = node;
        return true;
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (find_first_error(ts_node_child(node, i), found)) {
            return true;
        }
    }
    if (ts_node_has_error(node)) {
        // has_error set without a locatable child
        found = node;
        return true;
    }
    return false;
}

class Lowering {
public:
    Lowering(const TreeSitterParser& parser, std::string_view source)
        : parser_(parser), source_(source) {}

    SyntaxNode lower_module(TSNode root) {
        SyntaxNode module;
        module.kind = NodeKind::MODULE;
        module.start_line = start_line_of(root);
        module.end_line = end_line_of(root);
        lower_children(root, module.children);
        return module;
    }

private:
    const TreeSitterParser& parser_;
    std::string_view source_;

    std::string text(TSNode node) const {
        return parser_.node_text(node, source_);
    }

    // Identifiers joined by '.', independent of source whitespace
    std::string dotted_name(TSNode node) const {
        if (!is_type(node, "dotted_name")) {
            return text(node);
        }
        std::string out;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode part = ts_node_named_child(node, i);
            if (is_type(part, "comment")) {
                continue;
            }
            if (!out.empty()) {
                out += '.';
            }
            out += text(part);
        }
        return out;
    }

    ImportAlias import_alias(TSNode node) const {
        ImportAlias alias;
        if (is_type(node, "aliased_import")) {
            TSNode name = ts_node_child_by_field_name(node, "name", 4);
            TSNode as = ts_node_child_by_field_name(node, "alias", 5);
            alias.name = ts_node_is_null(name) ? "" : dotted_name(name);
            alias.asname = ts_node_is_null(as) ? "" : text(as);
        } else {
            alias.name = dotted_name(node);
        }
        return alias;
    }

    // Children carrying the given field name, in source order
    static std::vector<TSNode> field_children(TSNode node, const char* field) {
        std::vector<TSNode> out;
        TSTreeCursor cursor = ts_tree_cursor_new(node);
        if (ts_tree_cursor_goto_first_child(&cursor)) {
            do {
                const char* current = ts_tree_cursor_current_field_name(&cursor);
                if (current && std::strcmp(current, field) == 0) {
                    out.push_back(ts_tree_cursor_current_node(&cursor));
                }
            } while (ts_tree_cursor_goto_next_sibling(&cursor));
        }
        ts_tree_cursor_delete(&cursor);
        return out;
    }

    static bool has_async_keyword(TSNode node) {
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (!ts_node_is_named(child) && is_type(child, "async")) {
                return true;
            }
        }
        return false;
    }

    void lower_children(TSNode node, std::vector<SyntaxNode>& out) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            SyntaxNode child = lower(ts_node_named_child(node, i));
            // Drop subtrees with nothing an extractor could visit
            if (child.kind != NodeKind::OTHER || !child.children.empty()) {
                out.push_back(std::move(child));
            }
        }
    }

    SyntaxNode lower(TSNode node) {
        if (is_type(node, "decorated_definition")) {
            TSNode definition = ts_node_child_by_field_name(node, "definition", 10);
            if (!ts_node_is_null(definition)) {
                return lower(definition);
            }
        }

        SyntaxNode out;
        out.start_line = start_line_of(node);
        out.end_line = end_line_of(node);

        if (is_type(node, "function_definition")) {
            out.kind = has_async_keyword(node) ? NodeKind::ASYNC_FUNCTION_DEF
                                               : NodeKind::FUNCTION_DEF;
            TSNode name = ts_node_child_by_field_name(node, "name", 4);
            out.name = ts_node_is_null(name) ? "" : text(name);
            out.end_line = content_end_line(node);
            lower_children(node, out.children);
        } else if (is_type(node, "class_definition")) {
            out.kind = NodeKind::CLASS_DEF;
            TSNode name = ts_node_child_by_field_name(node, "name", 4);
            out.name = ts_node_is_null(name) ? "" : text(name);
            // Direct children of a class are its body statements
            TSNode body = ts_node_child_by_field_name(node, "body", 4);
            if (!ts_node_is_null(body)) {
                lower_children(body, out.children);
            }
        } else if (is_type(node, "import_statement")) {
            out.kind = NodeKind::IMPORT;
            for (TSNode name : field_children(node, "name")) {
                out.aliases.push_back(import_alias(name));
            }
        } else if (is_type(node, "import_from_statement") ||
                   is_type(node, "future_import_statement")) {
            out.kind = NodeKind::IMPORT_FROM;
            if (is_type(node, "future_import_statement")) {
                out.module = "__future__";
            } else {
                TSNode module = ts_node_child_by_field_name(node, "module_name", 11);
                if (!ts_node_is_null(module)) {
                    out.module = module_name(module);
                }
            }
            for (TSNode name : field_children(node, "name")) {
                out.aliases.push_back(import_alias(name));
            }
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                if (is_type(ts_node_named_child(node, i), "wildcard_import")) {
                    out.aliases.push_back(ImportAlias{"*", ""});
                }
            }
        } else {
            out.kind = NodeKind::OTHER;
            lower_children(node, out.children);
        }

        return out;
    }

    // Relative imports keep only their dotted part; `from . import x` has none
    std::string module_name(TSNode node) const {
        if (!is_type(node, "relative_import")) {
            return dotted_name(node);
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (is_type(child, "dotted_name")) {
                return dotted_name(child);
            }
        }
        return "";
    }
};

} // namespace

// ============================================================================
// TreeSitterParser implementation
// ============================================================================

TreeSitterParser::TreeSitterParser(Language lang)
    : parser_(nullptr), last_source_() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create TSParser");
    }

    // Get language grammar
    const TSLanguage* ts_lang = LanguageUtils::get_ts_language(lang);
    if (!ts_lang) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Unsupported language: " +
                                std::string(LanguageUtils::to_string(lang)));
    }

    // Set language for parser
    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set language for parser: " +
                                std::string(LanguageUtils::to_string(lang)));
    }

    spdlog::debug("TreeSitterParser created successfully for language: {}",
                  LanguageUtils::to_string(lang));
}

TreeSitterParser::~TreeSitterParser() {
    if (parser_) {
        ts_parser_delete(parser_);
    }
}

TreeSitterParser::TreeSitterParser(TreeSitterParser&& other) noexcept
    : parser_(other.parser_),
      last_source_(std::move(other.last_source_)) {
    other.parser_ = nullptr;
}

TreeSitterParser& TreeSitterParser::operator=(TreeSitterParser&& other) noexcept {
    if (this != &other) {
        if (parser_) {
            ts_parser_delete(parser_);
        }
        parser_ = other.parser_;
        last_source_ = std::move(other.last_source_);
        other.parser_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Tree> TreeSitterParser::parse_string(std::string_view source) {
    // Cache source for node_text operations
    last_source_ = std::string(source);

    spdlog::debug("Parsing string of length {}", source.size());

    TSTree* raw_tree = ts_parser_parse_string(
        parser_,
        nullptr,  // old_tree
        last_source_.data(),
        static_cast<uint32_t>(last_source_.size())
    );

    if (!raw_tree) {
        spdlog::error("Failed to parse source code");
        return nullptr;
    }

    auto tree = std::make_unique<Tree>(raw_tree);

    if (tree->has_error()) {
        spdlog::debug("Parse completed with syntax errors");
    } else {
        spdlog::debug("Parse completed successfully");
    }

    return tree;
}

SyntaxNode TreeSitterParser::parse(std::string_view source, std::string_view filename) {
    auto tree = parse_string(source);
    if (!tree) {
        throw ParseError("failed to parse (" + std::string(filename) + ")", 0);
    }

    TSNode error_node = tree->root_node();
    if (find_first_error(tree->root_node(), error_node)) {
        uint32_t line = start_line_of(error_node);
        throw ParseError("invalid syntax (" + std::string(filename) +
                         ", line " + std::to_string(line) + ")", line);
    }

    Lowering lowering(*this, last_source_);
    return lowering.lower_module(tree->root_node());
}

std::string TreeSitterParser::node_text(TSNode node, std::string_view source) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);

    if (start >= source.size() || end > source.size() || start >= end) {
        spdlog::warn("Invalid node byte range: [{}, {})", start, end);
        return "";
    }

    return std::string(source.substr(start, end - start));
}

} // namespace funcscan
