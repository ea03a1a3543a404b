#include "extract/FunctionRecord.hpp"

namespace funcscan {

ordered_json to_json(const FunctionRecord& record) {
    ordered_json j;
    j["name"] = record.name;
    j["signature"] = record.signature;
    j["body"] = record.body;
    j["start_line"] = record.start_line;
    j["end_line"] = record.end_line;
    j["imports"] = record.imports;
    j["module"] = record.module;
    return j;
}

ordered_json to_json(const std::vector<FunctionRecord>& records) {
    ordered_json array = ordered_json::array();
    for (const auto& record : records) {
        array.push_back(to_json(record));
    }
    return array;
}

} // namespace funcscan
