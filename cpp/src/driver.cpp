// src/driver.cpp
#include "dickson/driver.hpp"
#include "dickson/prime.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

inline std::string openmp_info() {
#ifdef _OPENMP
  return "openmp:" + std::to_string(_OPENMP);
#else
  return "openmp:off";
#endif
}
} // namespace

namespace dickson {

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info() + "; " + openmp_info();
}

std::vector<std::uint32_t> resolve_primes(const SweepConfig& cfg) {
  if (!cfg.primes.empty()) {
    std::vector<std::uint32_t> out = cfg.primes;
    for (std::uint32_t p : out) {
      if (!is_prime(p))
        throw std::invalid_argument("modulus " + std::to_string(p) +
                                    " is not prime");
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
  }
  if (cfg.prime_hi == 0)
    throw std::invalid_argument("no primes requested");
  return primes_in_range(cfg.prime_lo, cfg.prime_hi);
}

RunResult run(const SweepConfig& cfg, ProgressCb cb) {
  RunResult out;
  out.primes = resolve_primes(cfg);

  auto t0 = std::chrono::steady_clock::now();
  for (std::uint32_t p : out.primes) {
    if (cfg.all_parameters)
      out.table.append(sweep_parameters(p, cfg, cb));
    else
      out.table.append(sweep(p, cfg.a, cfg, cb));
  }
  auto t1 = std::chrono::steady_clock::now();

  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  out.engine_info = engine_info();
  return out;
}

} // namespace dickson
