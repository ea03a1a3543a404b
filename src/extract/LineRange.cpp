#include "extract/LineRange.hpp"
#include <algorithm>
#include <charconv>

namespace funcscan {

namespace {

std::optional<uint32_t> parse_line(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<LineRange> LineRange::parse(std::string_view text) {
    size_t dash = text.find('-');
    auto start = parse_line(text.substr(0, dash));
    if (!start) {
        return std::nullopt;
    }
    if (dash == std::string_view::npos) {
        return LineRange{*start, *start};
    }

    auto end = parse_line(text.substr(dash + 1));
    if (!end || *end < *start) {
        return std::nullopt;
    }
    return LineRange{*start, *end};
}

std::vector<FunctionRecord> filter_by_ranges(std::vector<FunctionRecord> records,
                                             const std::vector<LineRange>& ranges) {
    if (ranges.empty()) {
        return records;
    }

    records.erase(
        std::remove_if(records.begin(), records.end(),
            [&ranges](const FunctionRecord& record) {
                return std::none_of(ranges.begin(), ranges.end(),
                    [&record](const LineRange& range) {
                        return range.overlaps(record.start_line, record.end_line);
                    });
            }),
        records.end());
    return records;
}

} // namespace funcscan
