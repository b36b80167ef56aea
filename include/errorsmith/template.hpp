// template.hpp - text fragments written into the rewritten Go file
#pragma once
#include <string>
#include <string_view>

namespace errorsmith {

// Imports are added under private names so they cannot clash with the file's own.
inline constexpr const char* rand_package_path = "math/rand";
inline constexpr const char* rand_package_name = "_errorsmith_rand_";
inline constexpr const char* fmt_package_path = "fmt";
inline constexpr const char* fmt_package_name = "_errorsmith_fmt_";

// The one guard shape targeted: `if err == nil` / `if err != nil`.
inline constexpr const char* error_ident = "err";
inline constexpr const char* nil_ident = "nil";

// Modulus for the runtime coin flip: int(100 / error_percent).
// Throws std::invalid_argument when that is not a positive int (percent <= 0, > 100, NaN, or too small).
int make_denominator(double error_percent);

// `file` escaped for a Go interpreted string literal that is also used as a format string.
std::string go_format_literal(std::string_view file);

// Block inserted before a guard at file:line.
std::string render_injection(std::string_view file, int line, int denominator, bool trace);

// Import declarations inserted right after the package name.
std::string render_imports();

// Blank-identifier references appended at the end so the imports always count as used.
std::string render_references();

} // namespace errorsmith
