#pragma once
#include "errorsmith/go/ast.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace errorsmith::go {

struct ParseResult {
    bool success{false};
    std::unique_ptr<File> file; // set when success
    std::string error_message;  // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse Go source text into the statement tree the injector walks.
    // Only the constructs it has to see through are structured (if/else, blocks,
    // loops, switch/select clauses, labels, function literals); everything else
    // is kept as an opaque statement spanning balanced brackets.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

// Classify a condition's text: `a == b` / `a != b` between two identifiers becomes a
// BinaryExpr, anything else an OpaqueExpr. `base` is the offset of cond_text in the file.
ExprPtr classify_condition(std::string_view cond_text, std::size_t base);

} // namespace errorsmith::go
