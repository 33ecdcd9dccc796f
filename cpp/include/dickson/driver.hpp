// include/dickson/driver.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "dickson.hpp"
#include "table.hpp"

namespace dickson {

// Result summary of a driver run.
struct RunResult {
  std::vector<std::uint32_t> primes;  // primes actually swept, ascending
  ClassificationTable table;
  std::uint64_t ns_elapsed = 0;       // wall-clock nanoseconds (best effort)
  std::string engine_info;            // e.g. "gmp:6.3.0; gcc:13.2.0; openmp:201511"
};

// Primes named by cfg: the explicit list if non-empty, else [prime_lo,
// prime_hi]. Throws std::invalid_argument on a non-prime list entry, an
// inverted range, or when neither is given.
std::vector<std::uint32_t> resolve_primes(const SweepConfig& cfg);

// Sweeps every resolved prime (fixed a or all a) into one table.
RunResult run(const SweepConfig& cfg, ProgressCb cb = {});

std::string engine_info();

} // namespace dickson
