// format.hpp - validation and canonical indentation of Go source
#pragma once
#include <string>
#include <string_view>

namespace errorsmith {

struct FormatResult {
    bool success{false};
    std::string output;         // canonical text when success
    std::string error_message;  // parse failure otherwise
    int line{0};
    int column{0};
};

// Re-parse `src` and, if it is valid, re-indent it: one tab per nesting level
// (brackets opened on the same line count once), case clauses and labels one
// level out, operator continuation lines one level in, trailing blanks removed,
// blank-line runs collapsed, exactly one final newline. Lines inside raw strings
// and block comments are kept as written.
FormatResult format_source(std::string_view src, std::string_view filename = "<formatted>");

// The indentation pass alone; assumes balanced input.
std::string reindent(std::string_view src);

} // namespace errorsmith
