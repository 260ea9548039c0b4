#include "objcat/report.hpp"

#include <nlohmann/json.hpp>

namespace objcat {

std::string ErrorReport::to_plain() const {
    return "ERROR \"" + command + "\": " + message;
}

std::string ErrorReport::to_json() const {
    // ordered_json keeps insertion order: operation, command, error
    nlohmann::ordered_json j;
    j["operation"] = operation;
    j["command"] = command;
    j["error"] = message;
    // Object keys may hold any bytes; replace invalid UTF-8 instead of throwing
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void print_error_report(const ErrorReport& report, bool json, FILE* out) {
    std::string line = json ? report.to_json() : report.to_plain();
    fprintf(out, "%s\n", line.c_str());
    fflush(out);
}

}  // namespace objcat
