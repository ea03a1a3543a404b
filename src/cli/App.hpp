#pragma once

#include <ostream>

namespace funcscan {

constexpr const char* kVersion = "1.0.0";

/**
 * @brief Run one funcscan invocation
 *
 * Parses arguments, extracts records from the named file and writes them.
 *
 * @return Process exit code (0 success, 1 usage/read/parse failure)
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace funcscan
