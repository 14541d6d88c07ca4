// diagnostics_json.hpp - JSON serialization for build errors
#pragma once
#include "forge/env.hpp"
#include "forge/error.hpp"
#include <string>

namespace forge {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize one error to a compact JSON object.
std::string error_to_json(const build_error& e);

// If diag_json is enabled, print the error JSON to stderr.
void maybe_print_json(const build_error& e, const BuildEnv& env);

} // namespace forge
