#pragma once
#include <cstddef>

namespace forge {

// Default switch point between linear and sorted name lookups in a TypePlan.
constexpr size_t kLookupThreshold = 8;

struct BuildEnv {
    bool trace = false;                 // FORGE_TRACE=1: log every builder operation to llvm::errs()
    bool diag_json = false;             // FORGE_DIAG_JSON=1: print build errors as JSON on stderr
    bool check_invariants = false;      // FORGE_CHECK_INVARIANTS=1: verify the frame stack after each operation
    bool install_fatal_handler = false; // FORGE_INSTALL_FATAL_HANDLER=1
    size_t lookup_threshold = kLookupThreshold; // FORGE_LOOKUP_THRESHOLD
};

// Detect builder configuration from process env vars.
BuildEnv detect_env();

// Install the LLVM fatal error handler and pretty stack trace once per
// process when the environment asks for it. Returns true when installed.
bool install_fatal_handler_if_requested(const BuildEnv& env);

} // namespace forge
