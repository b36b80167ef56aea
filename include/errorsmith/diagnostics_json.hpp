// diagnostics_json.hpp - JSON serialization for InjectResult
#pragma once
#include "errorsmith/env.hpp"
#include "errorsmith/errorsmith.hpp"
#include <string>

namespace errorsmith {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a run result (without the rewritten source) to compact JSON, keys sorted.
std::string result_to_json(const InjectResult& r);

// If env.diag_json is set, print the result JSON to stderr.
void maybe_print_json(const InjectResult& r, const Env& env);

} // namespace errorsmith
