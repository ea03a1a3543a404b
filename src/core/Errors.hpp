#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace funcscan {

/**
 * @brief Raised when a source file cannot be opened or read
 */
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when source text is not syntactically valid
 *
 * The message is human readable and names the offending line.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, uint32_t line)
        : std::runtime_error(message), line_(line) {}

    /**
     * @brief 1-based line of the first syntax error (0 if unknown)
     */
    uint32_t line() const { return line_; }

private:
    uint32_t line_;
};

} // namespace funcscan
