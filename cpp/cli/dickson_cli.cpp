#include "dickson/dickson.hpp"
#include "dickson/driver.hpp"
#include "dickson/findings.hpp"
#include "dickson/hash.hpp"
#include "dickson/table.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::uint32_t parse_u32(const std::string& s, const char* what) {
  std::size_t used = 0;
  unsigned long long v = std::stoull(s, &used);
  if (used != s.size() || v > std::numeric_limits<std::uint32_t>::max())
    throw std::invalid_argument(std::string("bad ") + what + ": '" + s + "'");
  return static_cast<std::uint32_t>(v);
}

void print_summary(const dickson::RunResult& res, const dickson::SweepConfig& cfg) {
  const auto& table = res.table;
  for (auto p : res.primes) {
    const auto rows = table.for_prime(p);
    const auto perms = table.permutations(p);
    const auto cards = table.observed_cardinalities(p);
    const auto missing = table.missing_cardinalities(p);

    std::cout << "p=" << p << " | records=" << rows.size()
              << " | permutations=" << perms.size() << " | cardinalities=[";
    for (std::size_t i = 0; i < cards.size(); ++i)
      std::cout << (i ? "," : "") << cards[i];
    std::cout << "] | missing=[";
    for (std::size_t i = 0; i < missing.size(); ++i)
      std::cout << (i ? "," : "") << missing[i];
    std::cout << "] | digest=" << dickson::to_hex(dickson::make_table_digest(rows))
              << "\n";

    if (cfg.all_parameters && p > 2) {
      auto inv = dickson::parameter_invariance(table, p);
      std::cout << "  parameter invariance (a != 0): "
                << (inv.nonzero_invariant ? "yes" : "NO") << " | a=0 matches: "
                << (inv.zero_matches ? "yes" : "no") << "\n";
    }
    const std::uint32_t a = cfg.all_parameters ? 1u : cfg.a % p;
    auto crit = dickson::check_permutation_criterion(table, p, a);
    std::cout << "  gcd(n, p^2-1)=1 criterion (a=" << a << "): "
              << (crit.holds() ? "holds" : "diverges") << " | observed="
              << crit.observed.size() << " predicted=" << crit.predicted.size()
              << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  // Flags: --range=LO:HI --a=K --all-a --classical --csv=PATH --stride=K
  //        --threads=K --no-progress --bench=N, then primes
  dickson::SweepConfig cfg;
  unsigned repeats = 1;
  std::string csv_path;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a.rfind("--bench=", 0) == 0) {
        repeats = parse_u32(a.substr(8), "repeat count");
        if (repeats == 0)
          repeats = 1;
      } else if (a.rfind("--stride=", 0) == 0) {
        cfg.progress_stride = parse_u32(a.substr(9), "stride");
      } else if (a.rfind("--threads=", 0) == 0) {
        cfg.threads = parse_u32(a.substr(10), "thread count");
      } else if (a.rfind("--a=", 0) == 0) {
        cfg.a = parse_u32(a.substr(4), "parameter");
      } else if (a.rfind("--range=", 0) == 0) {
        const std::string r = a.substr(8);
        const auto colon = r.find(':');
        if (colon == std::string::npos)
          throw std::invalid_argument("bad range: '" + r + "' (want LO:HI)");
        cfg.prime_lo = parse_u32(r.substr(0, colon), "range bound");
        cfg.prime_hi = parse_u32(r.substr(colon + 1), "range bound");
      } else if (a.rfind("--csv=", 0) == 0) {
        csv_path = a.substr(6);
      } else if (a == "--all-a") {
        cfg.all_parameters = true;
      } else if (a == "--classical") {
        cfg.variant = dickson::Variant::Classical;
      } else if (a == "--no-progress") {
        cfg.enable_progress = false;
      } else {
        try {
          cfg.primes.push_back(parse_u32(a, "prime"));
        } catch (const std::exception& e) {
          std::cerr << "skip '" << a << "': " << e.what() << "\n";
        }
      }
    }
    if (cfg.primes.empty() && cfg.prime_hi == 0)
      cfg.primes = {5, 7, 11, 13};

    std::map<std::pair<std::uint32_t, std::uint32_t>, int> last;
    auto progress = [&](std::uint32_t p, std::uint32_t a, std::uint64_t n,
                        const dickson::ClassificationRecord&) {
      const std::uint64_t total = static_cast<std::uint64_t>(p) * p - 1;
      int pct = int((n + 1) * 100 / total);
      int& seen = last.emplace(std::make_pair(p, a), -1).first->second;
      if (pct / 20 > seen) { // print at ~20% steps
        std::cout << "  p=" << p << " a=" << a << " " << pct << "%\n";
        seen = pct / 20;
      }
    };

    std::uint64_t best = UINT64_MAX, sum = 0;
    dickson::RunResult res;
    for (unsigned r = 0; r < repeats; ++r) {
      last.clear();
      auto t0 = std::chrono::steady_clock::now();
      res = dickson::run(cfg, (cfg.enable_progress && repeats == 1)
                                  ? dickson::ProgressCb(progress)
                                  : dickson::ProgressCb{});
      auto t1 = std::chrono::steady_clock::now();
      auto ns =
          std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
      sum += ns;
      if ((std::uint64_t)ns < best)
        best = ns;
    }

    std::cout << "variant=" << dickson::to_string(cfg.variant)
              << " | records=" << res.table.size()
              << " | core(ns)=" << res.ns_elapsed
              << " | engine=" << res.engine_info << "\n";
    if (repeats > 1) {
      std::cout << "bench repeats=" << repeats << " | best(ns)=" << best
                << " | avg(ns)=" << (sum / repeats) << "\n";
    }
    print_summary(res, cfg);

    if (!csv_path.empty()) {
      dickson::write_csv(res.table, csv_path);
      std::cout << "wrote " << res.table.size() << " rows to " << csv_path
                << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
