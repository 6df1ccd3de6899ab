#pragma once
#include <string>

namespace formula {

struct build_env {
    bool trace = false;            // FORMULA_TRACE=1: tagged trace lines on stderr
    bool diag_json = false;        // FORMULA_DIAG_JSON=1: diagnostics JSON on stderr
    bool walk_named_args = false;  // FORMULA_WALK_NAMED_ARGS=1: default walks descend into named arguments
};

// Read the FORMULA_* variables from the process environment.
build_env detect_env();

namespace detail {
    bool env_flag_enabled(const char* name);
    // "[formula][<tag>] <msg>" on stderr when trace is on.
    void trace(const build_env& env, const char* tag, const std::string& msg);
}

} // namespace formula
