// errorsmith.hpp - one-shot rewrite of a Go file with probabilistic error injection
#pragma once
#include "errorsmith/format.hpp"
#include "errorsmith/go/ast.hpp"
#include "errorsmith/injector.hpp"
#include "errorsmith/source.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace errorsmith {

struct InjectOptions {
    double error_percent = 5.0; // chance, per guard and per execution, that the injected error fires
    bool trace = true;          // emit a Printf before the injected error
    bool log_sites = false;     // log each scheduled site to llvm::errs()
};

enum class ErrorKind { none, config_error, parse_error, structural_error, format_error };

const char* to_string(ErrorKind k);

struct InjectResult {
    bool success{false};
    bool formatted{false};
    ErrorKind kind{ErrorKind::none};
    // Rewritten source. Empty on config/parse/structural errors; the unformatted
    // rewrite on format_error.
    std::string output;
    std::string error_message;
    int line{0};
    int column{0};
    std::vector<InjectionSite> sites;
};

using Formatter = FormatResult (*)(std::string_view src, std::string_view filename);

// Parse `content`, schedule injections, apply them, add the import references and
// format. Never throws for bad input; every failure is reported through the result.
InjectResult inject_errors(std::string_view filename, std::string_view content, const InjectOptions& opts = {});

// Everything after parsing: imports, walk, materialize, emit. `file` is the tree
// parsed from `src`; else-if chains in it are rewritten in place.
InjectResult inject_tree(const SourceFile& src, go::File& file, const InjectOptions& opts = {}, Formatter format = &format_source);

// Append the import references to `rewritten` and format it into `r`. When the
// formatter rejects the text, `r` keeps it unformatted and becomes a format_error.
void emit_output(InjectResult& r, std::string rewritten, std::string_view filename, Formatter format = &format_source);

} // namespace errorsmith
