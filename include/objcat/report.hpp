#pragma once

#include <cstdio>
#include <string>

namespace objcat {

// The single line reported for a failed command:
//   plain: ERROR "<command>": <message>
//   json:  {"operation":"<operation>","command":"<command>","error":"<message>"}
struct ErrorReport {
    std::string operation;  // "cat"
    std::string command;    // "cat s3://bucket/key", the target as typed
    std::string message;

    std::string to_plain() const;
    std::string to_json() const;
};

// Write the report plus a newline to the stream (stderr by default)
void print_error_report(const ErrorReport& report, bool json, FILE* out = stderr);

}  // namespace objcat
