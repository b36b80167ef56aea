#include "errorsmith/env.hpp"
#include <cstdlib>
#include <string>

namespace errorsmith {

Env detect_env(){
    Env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("ERRORSMITH_TRACE_SITES")) e.trace_sites = (std::string(v) == "1");
    if (const char* v = get("ERRORSMITH_DIAG_JSON")) e.diag_json = (std::string(v) == "1");

    return e;
}

} // namespace errorsmith
