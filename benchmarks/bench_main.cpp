#include "forge/partial.hpp"
#include "forge/type_plan.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

// 24 i32 fields, looked up by name in reverse declaration order.
struct Record {
    int32_t v[24] = {};
};

namespace forge {

template <>
struct ShapeOf<Record> {
    static std::string name() { return "Record"; }
    static const Shape& shape(){
        static const Shape s = []{
            StructShape<Record> b(name());
            for(size_t i = 0; i < 24; ++i)
                b.field_at("field_" + std::to_string(i), member_offset(&Record::v) + i * sizeof(int32_t), &shape_of<int32_t>);
            return b.finish();
        }();
        return s;
    }
};

} // namespace forge

struct RunResult { double ms_build; int64_t checksum; };

static RunResult bench_case(const std::shared_ptr<const forge::TypePlan>& plan, size_t iterations){
    std::vector<std::string> names;
    for(size_t i = 24; i-- > 0;) names.push_back("field_" + std::to_string(i));

    int64_t checksum = 0;
    auto t0 = Clock::now();
    for(size_t it = 0; it < iterations; ++it){
        forge::Partial p = plan ? forge::Partial::alloc(forge::shape_of<Record>(), plan)
                                : forge::Partial::alloc<Record>();
        for(size_t i = 0; i < names.size(); ++i) p.set_field(names[i], int32_t(i));
        forge::HeapValue v = p.build();
        checksum += v.get<Record>().v[0];
    }
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), checksum };
}

int main(){
    // Tracing would dominate the timings
#ifdef _WIN32
    _putenv_s("FORGE_TRACE", "0");
#else
    setenv("FORGE_TRACE", "0", 1);
#endif
    size_t iterations = 20000;
    if(const char* n = getenv("FORGE_BENCH_ITERATIONS")) iterations = std::strtoul(n, nullptr, 10);

    struct Case { const char* name; std::shared_ptr<const forge::TypePlan> plan; };
    std::vector<Case> cases;
    cases.push_back({"shape_linear", nullptr});
    cases.push_back({"plan_linear", forge::TypePlan::build(forge::shape_of<Record>(), 64)});
    cases.push_back({"plan_sorted", forge::TypePlan::build(forge::shape_of<Record>(), 1)});

    std::cout << "name,iterations,ms_build,checksum\n";
    for(const auto& c : cases){
        try {
            auto r = bench_case(c.plan, iterations);
            std::cout << c.name << "," << iterations << "," << r.ms_build << "," << r.checksum << "\n";
        } catch (const forge::build_error& e) {
            std::cerr << "[bench] case '" << c.name << "' failed: " << e.what() << "\n";
            return 1;
        }
    }
    return 0;
}
