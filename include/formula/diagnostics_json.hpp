// diagnostics_json.hpp - JSON serialization for formula diagnostics
#pragma once
#include "formula/diagnostics.hpp"
#include "formula/env.hpp"
#include <string>

namespace formula {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const DiagnosticsResult& r);

// If diag_json is set (FORMULA_DIAG_JSON=1), print diagnostics JSON to stderr.
void maybe_print_json(const DiagnosticsResult& r, const build_env& env);

} // namespace formula
