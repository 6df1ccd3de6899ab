#include "formula/env.hpp"
#include <cstdio>
#include <cstdlib>

namespace formula {

namespace detail {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

void trace(const build_env& env, const char* tag, const std::string& msg){
    if(!env.trace) return;
    std::fprintf(stderr, "[formula][%s] %s\n", tag, msg.c_str());
}

} // namespace detail

build_env detect_env(){
    build_env e{};
    e.trace = detail::env_flag_enabled("FORMULA_TRACE");
    e.diag_json = detail::env_flag_enabled("FORMULA_DIAG_JSON");
    e.walk_named_args = detail::env_flag_enabled("FORMULA_WALK_NAMED_ARGS");
    return e;
}

} // namespace formula
