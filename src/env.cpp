#include "forge/env.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

namespace forge {

// Reads process env vars and constructs a BuildEnv.
// Partial::set_env overrides it per builder.
BuildEnv detect_env(){
    BuildEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("FORGE_TRACE")) e.trace = (std::string(v) == "1");
    if (const char* v = get("FORGE_DIAG_JSON")) e.diag_json = (std::string(v) == "1");
    if (const char* v = get("FORGE_CHECK_INVARIANTS")) e.check_invariants = (std::string(v) == "1");
    if (const char* v = get("FORGE_INSTALL_FATAL_HANDLER")) e.install_fatal_handler = (std::string(v) == "1");

    if (const char* v = get("FORGE_LOOKUP_THRESHOLD")){
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end && *end == '\0' && n > 0) e.lookup_threshold = static_cast<size_t>(n);
    }
    return e;
}

// LLVM fatal error handler (signature matches install_fatal_error_handler requirement)
static void forgeFatalHandler(void* userData, const char* reason, bool genCrashDiag){
    (void)userData; (void)genCrashDiag;
    fprintf(stderr, "[fatal][forge] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
    fprintf(stderr, "[fatal][forge] end stack trace\n");
}

bool install_fatal_handler_if_requested(const BuildEnv& env){
    static bool installed = false;
    if(installed) return true;
    if(!env.install_fatal_handler) return false;
    llvm::install_fatal_error_handler(forgeFatalHandler);
    llvm::EnablePrettyStackTrace();
    installed = true;
    fprintf(stderr, "[diag] Installed LLVM fatal error handler (FORGE_INSTALL_FATAL_HANDLER=1)\n");
    return installed;
}

} // namespace forge
