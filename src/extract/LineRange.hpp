#pragma once

#include "extract/FunctionRecord.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace funcscan {

/**
 * @brief Inclusive 1-based line range, e.g. a changed diff hunk
 */
struct LineRange {
    uint32_t start = 0;
    uint32_t end = 0;

    /**
     * @brief Parse "N" or "START-END"
     * @return nullopt if malformed, zero, or END < START
     */
    static std::optional<LineRange> parse(std::string_view text);

    bool overlaps(uint32_t first, uint32_t last) const {
        return end >= first && start <= last;
    }
};

/**
 * @brief Keep records overlapping at least one range
 *
 * An empty range list keeps everything.
 */
std::vector<FunctionRecord> filter_by_ranges(std::vector<FunctionRecord> records,
                                             const std::vector<LineRange>& ranges);

} // namespace funcscan
