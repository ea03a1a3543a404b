#include "extract/FileExtractor.hpp"
#include "extract/FunctionExtractor.hpp"
#include "extract/ImportCollector.hpp"
#include "extract/ModuleNamer.hpp"
#include <spdlog/spdlog.h>

namespace funcscan {

FileExtractor::FileExtractor(SourceParser& parser)
    : parser_(parser) {
}

std::vector<FunctionRecord> FileExtractor::extract_file(const std::filesystem::path& filepath) {
    SourceFile source = SourceFile::load(filepath);
    return extract_source(source);
}

std::vector<FunctionRecord> FileExtractor::extract_source(const SourceFile& source) {
    const std::string filename = source.path().string();

    SyntaxNode root = parser_.parse(source.text(), filename);

    std::vector<std::string> imports = ImportCollector::collect(root);
    std::string module = ModuleNamer::module_name(filename);

    FunctionExtractor extractor(source.lines(), std::move(imports), std::move(module));
    auto records = extractor.extract(root);

    spdlog::debug("{}: {} lines, {} records", filename, source.line_count(), records.size());
    return records;
}

} // namespace funcscan
