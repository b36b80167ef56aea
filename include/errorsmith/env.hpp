#pragma once

namespace errorsmith {

struct Env {
    bool trace_sites = false; // ERRORSMITH_TRACE_SITES=1: log every injection site
    bool diag_json = false;   // ERRORSMITH_DIAG_JSON=1: print the run result as JSON on stderr
};

// Read ERRORSMITH_* process variables. Called once by the driver; the library
// itself only sees the resulting values.
Env detect_env();

} // namespace errorsmith
