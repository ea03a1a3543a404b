#include "extract/FunctionExtractor.hpp"
#include "extract/SignatureSlicer.hpp"
#include <spdlog/spdlog.h>

namespace funcscan {

FunctionExtractor::FunctionExtractor(const std::vector<std::string>& lines,
                                     std::vector<std::string> imports,
                                     std::string module)
    : lines_(lines), imports_(std::move(imports)), module_(std::move(module)) {
}

std::vector<FunctionRecord> FunctionExtractor::extract(const SyntaxNode& root) const {
    std::vector<FunctionRecord> records;

    for (const auto& node : root.children) {
        if (node.is_function()) {
            records.push_back(make_record(node, ""));
        } else if (node.kind == NodeKind::CLASS_DEF) {
            for (const auto& item : node.children) {
                if (item.is_function()) {
                    records.push_back(make_record(item, node.name));
                }
            }
        }
    }

    spdlog::debug("Extracted {} function records", records.size());
    return records;
}

FunctionRecord FunctionExtractor::make_record(const SyntaxNode& function,
                                              const std::string& class_name) const {
    uint32_t start_line = function.start_line;
    uint32_t end_line = function.end_line ? function.end_line : function.start_line;

    SlicedFunction sliced = SignatureSlicer::slice(lines_, start_line, end_line);
    if (!sliced.signature_terminated) {
        spdlog::warn("No header terminator found for '{}' (lines {}-{})",
                     function.name, start_line, end_line);
    }

    spdlog::trace("{} '{}' at lines {}-{}", to_string(function.kind), function.name,
                  start_line, end_line);

    FunctionRecord record;
    record.name = class_name.empty() ? function.name : class_name + "." + function.name;
    record.signature = std::move(sliced.signature);
    record.body = std::move(sliced.body);
    record.start_line = start_line;
    record.end_line = end_line;
    record.imports = imports_;
    record.module = module_;
    return record;
}

} // namespace funcscan
