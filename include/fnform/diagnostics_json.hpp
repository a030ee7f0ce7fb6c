// diagnostics_json.hpp - JSON serialization for definition-form failures
#pragma once
#include "fnform/error.hpp"
#include <llvm/Support/Error.h>
#include <string>

namespace fnform {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":..,"message":..,"line":..,"col":..}; line/col are -1 when the
// offending form carries no reader position.
std::string diagnostic_to_json(const form_error& e);

// If FNFORM_DIAG_JSON=1 in the environment, print the diagnostic JSON to stderr.
void maybe_print_json(const form_error& e);

// Pass err through unchanged, printing any form_error in it first when FNFORM_DIAG_JSON=1.
llvm::Error report_form_errors(llvm::Error err);

} // namespace fnform
