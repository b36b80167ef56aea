#include "errorsmith/errorsmith.hpp"
#include "errorsmith/edit_buffer.hpp"
#include "errorsmith/go/parser.hpp"
#include "errorsmith/template.hpp"
#include <stdexcept>

namespace errorsmith {

const char* to_string(ErrorKind k){
    switch(k){
        case ErrorKind::none: return "none";
        case ErrorKind::config_error: return "config_error";
        case ErrorKind::parse_error: return "parse_error";
        case ErrorKind::structural_error: return "structural_error";
        case ErrorKind::format_error: return "format_error";
    }
    return "unknown";
}

static bool check_percent(InjectResult& r, double percent, int& denominator){
    try {
        denominator = make_denominator(percent);
        return true;
    } catch (const std::invalid_argument& e) {
        r.kind = ErrorKind::config_error; r.error_message = e.what();
        return false;
    }
}

InjectResult inject_errors(std::string_view filename, std::string_view content, const InjectOptions& opts){
    InjectResult r;
    int denominator = 0;
    if(!check_percent(r, opts.error_percent, denominator)) return r;

    SourceFile src{std::string(filename), std::string(content)};
    go::Parser parser;
    auto pr = parser.parse_string(src.content(), src.name());
    if(!pr.success){
        r.kind = ErrorKind::parse_error; r.error_message = pr.error_message;
        r.line = pr.line; r.column = pr.column;
        return r;
    }
    return inject_tree(src, *pr.file, opts);
}

InjectResult inject_tree(const SourceFile& src, go::File& file, const InjectOptions& opts, Formatter format){
    InjectResult r;
    int denominator = 0;
    if(!check_percent(r, opts.error_percent, denominator)) return r;

    EditBuffer edits(src.content());
    edits.insert(file.package_name_end, render_imports());

    Injector injector(src, edits, denominator, opts.trace);
    injector.log_sites(opts.log_sites);
    try {
        injector.walk(file);
    } catch (const StructuralError& e) {
        r.kind = ErrorKind::structural_error; r.error_message = e.what();
        r.line = src.line(e.position); r.column = src.column(e.position);
        return r;
    }
    r.sites = injector.sites();

    emit_output(r, edits.materialize(), src.name(), format);
    return r;
}

void emit_output(InjectResult& r, std::string rewritten, std::string_view filename, Formatter format){
    rewritten += render_references();

    auto fr = format(rewritten, filename);
    if(!fr.success){
        // Keep the unformatted text so the broken rewrite can be inspected.
        r.output = std::move(rewritten);
        r.formatted = false;
        r.success = false;
        r.kind = ErrorKind::format_error;
        r.error_message = "Code formatting failed with Go parse error: " + fr.error_message;
        r.line = fr.line; r.column = fr.column;
        return;
    }
    r.output = std::move(fr.output);
    r.formatted = true;
    r.success = true;
    r.kind = ErrorKind::none;
}

} // namespace errorsmith
