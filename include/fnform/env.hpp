#pragma once

namespace fnform {

struct form_env {
    bool trace = false;     // FNFORM_TRACE: log parse decisions to stderr
    bool diagJson = false;  // FNFORM_DIAG_JSON: print expansion failures as JSON to stderr
};

// Detect configuration from process env vars. Read on every call so a host can
// flip the flags between expansions.
form_env detect_env();

} // namespace fnform
