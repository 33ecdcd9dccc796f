// include/dickson/dickson.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dickson {

// Bump when the record layout or CSV contract changes.
inline constexpr const char* DICKSON_VERSION = "0.1.0";

// Both variants share D_0 = 2, D_1 = lead, D_n = lead*D_{n-1} - trail*D_{n-2}.
//   Reversed  D_n(a, x): lead = a, trail = x
//   Classical E_n(x, a): lead = x, trail = a
enum class Variant { Reversed, Classical };

const char* to_string(Variant v) noexcept;

// One row of the output table. Value type; never mutated after classify().
struct ClassificationRecord {
  std::uint32_t p = 0;
  std::uint32_t a = 0;
  std::uint64_t n = 0;
  std::uint32_t cardinality = 0;
  bool is_permutation = false;
  std::vector<std::uint32_t> values; // sorted ascending, size == cardinality
};

bool operator==(const ClassificationRecord& lhs, const ClassificationRecord& rhs);
bool operator!=(const ClassificationRecord& lhs, const ClassificationRecord& rhs);

// Sweep driver knobs.
struct SweepConfig {
  std::vector<std::uint32_t> primes;  // explicit primes, used when non-empty
  std::uint32_t prime_lo = 0;         // otherwise every prime in [lo, hi]
  std::uint32_t prime_hi = 0;
  bool all_parameters = false;        // sweep every a in [0, p)
  std::uint32_t a = 1;                // fixed parameter when !all_parameters
  Variant variant = Variant::Reversed;
  bool enable_progress = true;        // allow callbacks
  std::uint32_t progress_stride = 0;  // 0 = auto (~1% of p^2 - 1)
  unsigned threads = 0;               // 0 = OpenMP default
};

// Progress callback: (p, a, n, record just produced). Serialized even when
// parameter sweeps run in parallel.
using ProgressCb = std::function<void(std::uint32_t, std::uint32_t,
                                      std::uint64_t,
                                      const ClassificationRecord&)>;

// Value set of x -> D_n(a, x) over F_p.
// Throws std::invalid_argument if n < 0 or p < 2. Primality is not checked.
ClassificationRecord classify(std::uint32_t p, std::uint32_t a, std::int64_t n,
                              Variant variant = Variant::Reversed);

// One record per n in [0, p^2 - 1), in increasing n, for a fixed a.
std::vector<ClassificationRecord> sweep(std::uint32_t p, std::uint32_t a,
                                        const SweepConfig& cfg = {},
                                        ProgressCb cb = {});

// sweep() for every a in [0, p); records ordered by a, then n.
std::vector<ClassificationRecord>
sweep_parameters(std::uint32_t p, const SweepConfig& cfg = {},
                 ProgressCb cb = {});

} // namespace dickson
