#include "extract/ImportCollector.hpp"

namespace funcscan {

namespace {

std::string render_alias(const ImportAlias& alias) {
    if (alias.asname.empty()) {
        return alias.name;
    }
    return alias.name + " as " + alias.asname;
}

} // namespace

std::vector<std::string> ImportCollector::render(const SyntaxNode& node) {
    std::vector<std::string> lines;

    if (node.kind == NodeKind::IMPORT) {
        for (const auto& alias : node.aliases) {
            lines.push_back("import " + render_alias(alias));
        }
    } else if (node.kind == NodeKind::IMPORT_FROM) {
        std::string names;
        for (const auto& alias : node.aliases) {
            if (!names.empty()) {
                names += ", ";
            }
            names += render_alias(alias);
        }
        // An empty module keeps both spaces: "from  import x"
        lines.push_back("from " + node.module + " import " + names);
    }

    return lines;
}

void ImportCollector::walk(const SyntaxNode& node, std::vector<std::string>& out) {
    if (node.kind == NodeKind::IMPORT || node.kind == NodeKind::IMPORT_FROM) {
        for (auto& line : render(node)) {
            out.push_back(std::move(line));
        }
    }
    for (const auto& child : node.children) {
        walk(child, out);
    }
}

std::vector<std::string> ImportCollector::collect(const SyntaxNode& root) {
    std::vector<std::string> imports;
    walk(root, imports);
    return imports;
}

} // namespace funcscan
