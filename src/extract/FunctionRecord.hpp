#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace funcscan {

using ordered_json = nlohmann::ordered_json;

/**
 * @brief Extracted metadata for one function or method
 */
struct FunctionRecord {
    std::string name;        // "func" or "Class.method"
    std::string signature;   // Header text through the terminating ':'
    std::string body;        // Verbatim lines start_line..end_line
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    std::vector<std::string> imports;  // Whole-file import list
    std::string module;
};

/**
 * @brief Serialize with keys in output order
 */
ordered_json to_json(const FunctionRecord& record);

ordered_json to_json(const std::vector<FunctionRecord>& records);

} // namespace funcscan
