#include "forge/diagnostics_json.hpp"
#include <cstdio>

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

namespace forge {

// llvm::json rejects invalid UTF-8; messages may quote arbitrary user text.
static llvm::json::Value json_text(llvm::StringRef s){
    if(llvm::json::isUTF8(s)) return llvm::json::Value(s.str());
    return llvm::json::Value(llvm::json::fixUTF8(s));
}

std::string json_escape(const std::string& s){
    std::string out;
    llvm::raw_string_ostream os(out);
    llvm::json::OStream(os).value(json_text(s));
    return os.str();
}

std::string error_to_json(const build_error& e){
    std::string out;
    llvm::raw_string_ostream os(out);
    llvm::json::OStream j(os);
    j.object([&]{
        j.attribute("code", e.code());
        j.attribute("kind", error_kind_name(e.kind));
        j.attribute("message", json_text(e.message));
        j.attribute("hint", json_text(e.hint));
        j.attribute("path", json_text(e.path));
    });
    return os.str();
}

void maybe_print_json(const build_error& e, const BuildEnv& env){
    if(!env.diag_json) return;
    auto js = error_to_json(e);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace forge
