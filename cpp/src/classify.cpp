// src/classify.cpp
#include "dickson/dickson.hpp"
#include "dickson/recurrence.hpp"

#include <algorithm> // std::max
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace dickson {
namespace {

// Presence mask over F_p, reused across n so the hot loop only allocates the
// record's own value vector.
class ValueSetBuilder {
public:
  explicit ValueSetBuilder(std::uint32_t p) : seen_(p, 0) {}

  void mark(std::uint32_t v) {
#if defined(DICKSON_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
    if (v >= seen_.size())
      throw std::logic_error("residue out of range [0, p)");
#endif
    if (!seen_[v]) {
      seen_[v] = 1;
      ++count_;
    }
  }

  // Emits the record and clears the mask for the next n.
  ClassificationRecord finish(std::uint32_t p, std::uint32_t a,
                              std::uint64_t n) {
    ClassificationRecord r;
    r.p = p;
    r.a = a;
    r.n = n;
    r.cardinality = count_;
    r.is_permutation = (count_ == p);
    r.values.reserve(count_);
    for (std::uint32_t v = 0; v < p; ++v) {
      if (seen_[v]) {
        r.values.push_back(v);
        seen_[v] = 0;
      }
    }
    count_ = 0;
    return r;
  }

private:
  std::vector<std::uint8_t> seen_;
  std::uint32_t count_ = 0;
};

inline void require_modulus(std::uint32_t p) {
  if (p < 2)
    throw std::invalid_argument("modulus p must be >= 2");
}

inline std::uint64_t period_of(std::uint32_t p) {
  return static_cast<std::uint64_t>(p) * p - 1;
}

} // namespace

bool operator==(const ClassificationRecord& lhs,
                const ClassificationRecord& rhs) {
  return lhs.p == rhs.p && lhs.a == rhs.a && lhs.n == rhs.n &&
         lhs.cardinality == rhs.cardinality &&
         lhs.is_permutation == rhs.is_permutation && lhs.values == rhs.values;
}

bool operator!=(const ClassificationRecord& lhs,
                const ClassificationRecord& rhs) {
  return !(lhs == rhs);
}

ClassificationRecord classify(std::uint32_t p, std::uint32_t a, std::int64_t n,
                              Variant variant) {
  if (n < 0)
    throw std::invalid_argument("n must be non-negative");
  require_modulus(p);

  a %= p;
  ValueSetBuilder vs(p);
  for (std::uint32_t x = 0; x < p; ++x) {
    RecurrenceStepper s(a, x, p, variant);
    s.advance_to(static_cast<std::uint64_t>(n));
    vs.mark(s.value());
  }
  return vs.finish(p, a, static_cast<std::uint64_t>(n));
}

std::vector<ClassificationRecord> sweep(std::uint32_t p, std::uint32_t a,
                                        const SweepConfig& cfg, ProgressCb cb) {
  require_modulus(p);
  a %= p;

  const std::uint64_t total = period_of(p);
  // Effective progress stride (0 => auto ~1%).
  const std::uint64_t stride =
      (cfg.progress_stride != 0)
          ? cfg.progress_stride
          : std::max<std::uint64_t>(1, total / 100);
  const bool report = cb && cfg.enable_progress;

  std::vector<ClassificationRecord> out;
  out.reserve(total);

  // One fused loop: every x advances together, one n per iteration.
  LockstepRecurrence rec(a, p, cfg.variant);
  ValueSetBuilder vs(p);
  for (std::uint64_t n = 0; n < total; ++n) {
    for (const auto& slot : rec.slots())
      vs.mark(slot.cur);
    out.push_back(vs.finish(p, a, n));

    if (report && ((n + 1) % stride == 0 || n + 1 == total))
      cb(p, a, n, out.back());

    rec.step();
  }
  return out;
}

std::vector<ClassificationRecord>
sweep_parameters(std::uint32_t p, const SweepConfig& cfg, ProgressCb cb) {
  require_modulus(p);

  // Each a writes only its own slot; concatenated in a order afterwards.
  std::vector<std::vector<ClassificationRecord>> per_a(p);

  ProgressCb serialized;
  if (cb && cfg.enable_progress) {
    serialized = [&cb](std::uint32_t pp, std::uint32_t a, std::uint64_t n,
                       const ClassificationRecord& r) {
#ifdef _OPENMP
#pragma omp critical(dickson_progress)
#endif
      cb(pp, a, n, r);
    };
  }

  std::exception_ptr failure;
  const long long count = static_cast<long long>(p);

#ifdef _OPENMP
  const int nthreads =
      cfg.threads != 0 ? static_cast<int>(cfg.threads) : omp_get_max_threads();
#pragma omp parallel for schedule(dynamic) num_threads(nthreads)
#endif
  for (long long i = 0; i < count; ++i) {
    try {
      per_a[static_cast<std::size_t>(i)] =
          sweep(p, static_cast<std::uint32_t>(i), cfg, serialized);
    } catch (...) {
      // Exceptions may not leave an OpenMP region; keep the first and rethrow.
#ifdef _OPENMP
#pragma omp critical(dickson_failure)
#endif
      if (!failure)
        failure = std::current_exception();
    }
  }
  if (failure)
    std::rethrow_exception(failure);

  std::vector<ClassificationRecord> out;
  out.reserve(static_cast<std::size_t>(p) * period_of(p));
  for (auto& rows : per_a) {
    for (auto& r : rows)
      out.push_back(std::move(r));
  }
  return out;
}

} // namespace dickson
