#pragma once

#include "core/SourceFile.hpp"
#include "core/SyntaxTree.hpp"
#include "extract/FunctionRecord.hpp"
#include <filesystem>
#include <vector>

namespace funcscan {

/**
 * @brief High-level API: one source file in, function records out
 *
 * Runs read -> parse -> collect imports -> extract functions -> name module.
 * The parser is injected so tests can supply a hand-built tree.
 */
class FileExtractor {
public:
    explicit FileExtractor(SourceParser& parser);

    /**
     * @brief Extract records from a file on disk
     * @throws IOError if the file cannot be read
     * @throws ParseError if the file is not valid source
     */
    std::vector<FunctionRecord> extract_file(const std::filesystem::path& filepath);

    /**
     * @brief Extract records from already loaded source
     * @throws ParseError if the source is not valid
     */
    std::vector<FunctionRecord> extract_source(const SourceFile& source);

private:
    SourceParser& parser_;
};

} // namespace funcscan
