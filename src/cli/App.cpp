#include "cli/App.hpp"
#include "cli/Emitter.hpp"
#include "core/Errors.hpp"
#include "core/TreeSitterParser.hpp"
#include "extract/FileExtractor.hpp"
#include "extract/LineRange.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace funcscan {

namespace {

constexpr const char* kUsage = "Usage: funcscan [OPTIONS] <file_path>";

}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    CLI::App app{"funcscan - extract function metadata from a Python source file"};

    std::string file_path;
    app.add_option("file_path", file_path, "Python source file to scan")
        ->required();

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->default_val("warn");

    std::vector<std::string> line_specs;
    app.add_option("--lines", line_specs, "Only emit functions overlapping START[-END] (repeatable)")
        ->allow_extra_args(false)
        ->delimiter(',')
        ->check(CLI::Validator(
            [](std::string& spec) -> std::string {
                return LineRange::parse(spec) ? "" : "Invalid line range: " + spec;
            },
            "START[-END]"));

    bool compact = false;
    app.add_flag("--compact", compact, "Emit the JSON array on a single line");

    app.set_version_flag("--version", std::string("funcscan version ") + kVersion);

    Emitter emitter(out, err);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == static_cast<int>(CLI::ExitCodes::Success)) {
            return app.exit(e, out, err);
        }
        err << e.what() << '\n';
        return emitter.emit_usage(kUsage);
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    std::vector<LineRange> ranges;
    for (const auto& spec : line_specs) {
        if (auto range = LineRange::parse(spec)) {
            ranges.push_back(*range);
        }
    }

    spdlog::info("Scanning {}", file_path);

    try {
        TreeSitterParser parser(Language::PYTHON);
        FileExtractor extractor(parser);

        auto records = filter_by_ranges(extractor.extract_file(file_path), ranges);

        Emitter output(out, err, compact ? -1 : 2);
        return output.emit_records(records);

    } catch (const ParseError& e) {
        spdlog::debug("Parse failed at line {}: {}", e.line(), e.what());
        return emitter.emit_error(e.what());
    } catch (const IOError& e) {
        spdlog::debug("Read failed: {}", e.what());
        return emitter.emit_error(e.what());
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return emitter.emit_error(e.what());
    }
}

} // namespace funcscan
