#include "chain_bench_support.hpp"

auto main() -> int {
    objchain_bench::run_chain_build_bench(objchain_bench::seed);
    objchain_bench::run_chain_access_bench(objchain_bench::seed);
    return 0;
}
