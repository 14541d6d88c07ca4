// Config loading example: "dotted.key = value" lines in any order, assembled
// into a typed struct through a deferred Partial.
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include "forge/partial.hpp"

struct Listener {
    std::string host;
    uint16_t port = 0;
    bool tls = false;
};

struct Limits {
    uint32_t max_connections = 0;
    double timeout_s = 0;
};

struct ServerConfig {
    std::string name;
    Listener listen;
    Limits limits;
    std::vector<std::string> tags;
    std::optional<std::string> motd;
};

namespace forge {

template <>
struct ShapeOf<Listener> {
    static std::string name() { return "Listener"; }
    static const Shape& shape(){
        static const Shape s = StructShape<Listener>(name())
                                   .field("host", &Listener::host)
                                   .field("port", &Listener::port)
                                   .field("tls", &Listener::tls, FieldHasDefault)
                                   .finish();
        return s;
    }
};

inline uint32_t default_max_connections() { return 256; }
inline double default_timeout() { return 30.0; }

template <>
struct ShapeOf<Limits> {
    static std::string name() { return "Limits"; }
    static const Shape& shape(){
        static const Shape s = StructShape<Limits>(name())
                                   .field_default<&default_max_connections>("max_connections", &Limits::max_connections)
                                   .alias("max_conn")
                                   .field_default<&default_timeout>("timeout_s", &Limits::timeout_s)
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<ServerConfig> {
    static std::string name() { return "ServerConfig"; }
    static const Shape& shape(){
        static const Shape s = StructShape<ServerConfig>(name())
                                   .field("name", &ServerConfig::name)
                                   .field("listen", &ServerConfig::listen)
                                   .field("limits", &ServerConfig::limits, FieldHasDefault)
                                   .field("tags", &ServerConfig::tags, FieldHasDefault)
                                   .field("motd", &ServerConfig::motd)
                                   .finish();
        return s;
    }
};

} // namespace forge

// Applies one "a.b.c = text" (or "a.b += text" for lists) line to the builder.
static void apply_line(forge::Partial& p, llvm::StringRef line){
    bool append = line.contains("+=");
    auto kv = append ? line.split("+=") : line.split('=');
    llvm::StringRef key = kv.first.trim();
    llvm::StringRef value = kv.second.trim();

    llvm::SmallVector<llvm::StringRef, 4> parts;
    key.split(parts, '.');
    size_t opened = 0;
    for(llvm::StringRef part : parts){
        p.begin_field(part);
        ++opened;
    }
    while(p.shape().is(forge::ShapeKind::Option)){
        p.begin_optional_payload();
        ++opened;
    }
    if(append){
        p.begin_list_item();
        ++opened;
    }
    p.parse_from_str(value);
    for(size_t i = 0; i < opened; ++i) p.end();
}

int main(){
    const char* src = R"CFG(
        listen.port = 8443
        tags += edge
        name = gateway
        limits.max_conn = 1024
        listen.host = 0.0.0.0
        tags += eu-west
        listen.tls = true
        motd = welcome
    )CFG";

    forge::TypedPartial<ServerConfig> p;
    try {
        p->begin_deferred();
        llvm::SmallVector<llvm::StringRef, 16> lines;
        llvm::StringRef(src).split(lines, '\n', -1, false);
        for(llvm::StringRef raw : lines){
            llvm::StringRef line = raw.trim();
            if(line.empty() || line.startswith("#")) continue;
            apply_line(p.inner(), line);
        }
        p->finish_deferred();
        ServerConfig cfg = p.build();

        llvm::outs() << cfg.name << " listening on " << cfg.listen.host << ":" << cfg.listen.port
                     << (cfg.listen.tls ? " (tls)" : "") << "\n";
        llvm::outs() << "max connections " << cfg.limits.max_connections << ", timeout " << cfg.limits.timeout_s << "s\n";
        llvm::outs() << "tags:";
        for(const auto& t : cfg.tags) llvm::outs() << " " << t;
        llvm::outs() << "\nmotd: " << cfg.motd.value_or("<none>") << "\n";
    } catch (const forge::build_error& e) {
        llvm::errs() << "config error: " << e.what() << "\n";
        return 1;
    }
    std::cout << "config example OK\n";
    return 0;
}
