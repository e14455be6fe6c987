#ifndef OBJCHAIN_BENCHMARKS_CHAIN_BENCH_SUPPORT_HPP
#define OBJCHAIN_BENCHMARKS_CHAIN_BENCH_SUPPORT_HPP

#include <chrono>
#include <cstdint>
#include <tuple>
#include <utility>

#include <nanobench.h>

#include <objchain/objchain.hpp>

namespace objchain_bench {

inline constexpr std::uint32_t seed = 42;

// xorshift32: cheap PRNG so payload values are not known at compile time.
static inline std::uint32_t xorshift32(std::uint32_t x) noexcept {
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    return x;
}

template<typename Fn> void run_case(ankerl::nanobench::Bench &bench, std::uint64_t batch, const char *label, Fn &&fn) {
    auto fn_local = std::forward<Fn>(fn);
    bench.batch(batch).run(label, [fn_local = std::move(fn_local)]() mutable {
        const auto result = fn_local();
        ankerl::nanobench::doNotOptimizeAway(result);
    });
}

// Payloads of a small sensor pipeline, one type per stage.
struct raw_sample {
    std::uint32_t adc;
};
struct calibration {
    std::uint32_t offset;
    std::uint32_t gain;
};
struct filter_state {
    std::uint64_t accumulator;
};
struct output_stage {
    std::uint16_t scale;
};

using pipeline_chain = objchain::chain_t<raw_sample, calibration, filter_state, output_stage>;
using pipeline_tuple = std::tuple<raw_sample, calibration, filter_state, output_stage>;

struct pipeline_struct {
    raw_sample raw;
    calibration cal;
    filter_state filter;
    output_stage out;
};

inline auto make_pipeline_chain(std::uint32_t s) -> pipeline_chain {
    return objchain::terminal{ raw_sample{ s } }
      .append(calibration{ s >> 3, s >> 5 })
      .append(filter_state{ s })
      .append(output_stage{ static_cast<std::uint16_t>(s) });
}

inline auto make_pipeline_tuple(std::uint32_t s) -> pipeline_tuple {
    return pipeline_tuple{
        raw_sample{ s }, calibration{ s >> 3, s >> 5 }, filter_state{ s }, output_stage{ static_cast<std::uint16_t>(s) }
    };
}

void run_chain_build_bench(std::uint32_t s);
void run_chain_access_bench(std::uint32_t s);

}// namespace objchain_bench

#endif// OBJCHAIN_BENCHMARKS_CHAIN_BENCH_SUPPORT_HPP
