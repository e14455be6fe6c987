/// \file chain_build_bench.cpp
/// \brief Cost of building a four-stage chain compared with std::tuple.
///
/// Appending moves the whole chain into the new outermost link, so a naive
/// reading suggests O(n^2) copies. With the payloads below every move is a
/// trivial copy and the optimiser should emit the same stores as for a tuple.

#include "chain_bench_support.hpp"

namespace objchain_bench {

using namespace std::chrono_literals;

void run_chain_build_bench(std::uint32_t s) {
    ankerl::nanobench::Bench bench;
    bench.title("Build: 4 heterogeneous payloads");
    bench.minEpochTime(10ms).relative(true);

    run_case(bench, 1, "std::tuple", [&s]() {
        s = xorshift32(s);
        const auto t = make_pipeline_tuple(s);
        return std::get<3>(t).scale + std::get<0>(t).adc;
    });

    run_case(bench, 1, "terminal.append x3", [&s]() {
        s = xorshift32(s);
        const auto c = make_pipeline_chain(s);
        return c.get().scale + c.parent.parent.parent.get().adc;
    });

    run_case(bench, 1, "make_chain", [&s]() {
        s = xorshift32(s);
        const auto c = objchain::make_chain(raw_sample{ s },
          calibration{ s >> 3, s >> 5 },
          filter_state{ s },
          output_stage{ static_cast<std::uint16_t>(s) });
        return c.get().scale + c.parent.parent.parent.get().adc;
    });
}

}// namespace objchain_bench
