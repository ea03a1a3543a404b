#pragma once

#include "core/SyntaxTree.hpp"
#include "extract/FunctionRecord.hpp"
#include <string>
#include <vector>

namespace funcscan {

/**
 * @brief Emits one record per module-level function and per class method
 *
 * Only direct children of the root, and direct children of root-level
 * classes, are visited. Nested functions and nested classes are skipped.
 */
class FunctionExtractor {
public:
    /**
     * @param lines Source lines with terminators, indexed by line - 1
     * @param imports File-wide import list copied into every record
     * @param module Module name copied into every record
     */
    FunctionExtractor(const std::vector<std::string>& lines,
                      std::vector<std::string> imports,
                      std::string module);

    /**
     * @brief Extract records in source order
     */
    std::vector<FunctionRecord> extract(const SyntaxNode& root) const;

private:
    const std::vector<std::string>& lines_;
    std::vector<std::string> imports_;
    std::string module_;

    FunctionRecord make_record(const SyntaxNode& function,
                               const std::string& class_name) const;
};

} // namespace funcscan
