#pragma once

#include "extract/FunctionRecord.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace funcscan {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

/**
 * @brief Writes the result of one invocation and picks the exit code
 *
 * Records go to the output stream; errors and usage go to the error stream.
 */
class Emitter {
public:
    /**
     * @param indent JSON indentation; negative for a single line
     */
    Emitter(std::ostream& out, std::ostream& err, int indent = 2);

    int emit_records(const std::vector<FunctionRecord>& records);

    /**
     * @brief Write {"error": message} to the error stream
     */
    int emit_error(const std::string& message);

    int emit_usage(const std::string& usage);

private:
    std::ostream& out_;
    std::ostream& err_;
    int indent_;
};

} // namespace funcscan
