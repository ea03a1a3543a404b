#include "cli/Emitter.hpp"

namespace funcscan {

Emitter::Emitter(std::ostream& out, std::ostream& err, int indent)
    : out_(out), err_(err), indent_(indent) {
}

int Emitter::emit_records(const std::vector<FunctionRecord>& records) {
    out_ << to_json(records).dump(indent_, ' ', true,
                                  ordered_json::error_handler_t::replace)
         << '\n';
    out_.flush();
    return kExitSuccess;
}

int Emitter::emit_error(const std::string& message) {
    ordered_json error = {{"error", message}};
    err_ << error.dump(-1, ' ', true, ordered_json::error_handler_t::replace) << '\n';
    err_.flush();
    return kExitFailure;
}

int Emitter::emit_usage(const std::string& usage) {
    err_ << usage << '\n';
    err_.flush();
    return kExitFailure;
}

} // namespace funcscan
