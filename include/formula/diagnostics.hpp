// Diagnostics derived from the recovery placeholders left in a built AST.
#pragma once
#include "formula/ast.hpp"
#include <string>
#include <vector>

namespace formula {

// Offsets are -1 when the node carried no span.
struct FormulaError { std::string code; std::string message; std::string hint; long start=-1; long end=-1; node_id node=0; };
struct FormulaWarning { std::string code; std::string message; std::string hint; long start=-1; long end=-1; node_id node=0; };

struct DiagnosticsResult { bool success=true; std::vector<FormulaError> errors; std::vector<FormulaWarning> warnings; };

// Codes:
//   E0100 parser error (unrecognized CST or grammar failure)
//   E0101 invalid number literal
//   W0100 missing argument
DiagnosticsResult collect_diagnostics(const build_result& r);

} // namespace formula
