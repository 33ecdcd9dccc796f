#include "dickson/dickson.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <stdexcept>

TEST_CASE("Progress callback fires once per n with stride 1") {
  using dickson::ClassificationRecord; using dickson::SweepConfig; using dickson::sweep;

  std::atomic<unsigned> hits{0};
  bool in_order = true;
  std::uint64_t expect = 0;
  auto cb = [&](std::uint32_t p, std::uint32_t a, std::uint64_t n,
                const ClassificationRecord& r) {
    in_order = in_order && p == 7 && a == 2 && n == expect && r.n == n;
    ++expect;
    ++hits;
  };

  SweepConfig cfg;
  cfg.progress_stride = 1;
  const unsigned p = 7; // p^2 - 1 = 48 steps
  auto rs = sweep(p, 2, cfg, cb);
  REQUIRE(rs.size() == p * p - 1);
  REQUIRE(hits.load() == p * p - 1);
  REQUIRE(in_order);
}

TEST_CASE("Auto stride reports about 1% of the sweep and always the last n") {
  using dickson::ClassificationRecord; using dickson::sweep;

  unsigned hits = 0;
  std::uint64_t last = 0;
  auto cb = [&](std::uint32_t, std::uint32_t, std::uint64_t n,
                const ClassificationRecord&) { ++hits; last = n; };

  sweep(23, 1, {}, cb); // 528 steps, stride 5
  REQUIRE(hits == 528 / 5 + 1);
  REQUIRE(last == 527);
}

TEST_CASE("Disabled progress never calls back") {
  using dickson::ClassificationRecord; using dickson::SweepConfig; using dickson::sweep;

  unsigned hits = 0;
  auto cb = [&](std::uint32_t, std::uint32_t, std::uint64_t,
                const ClassificationRecord&) { ++hits; };
  SweepConfig cfg;
  cfg.enable_progress = false;
  cfg.progress_stride = 1;
  sweep(5, 1, cfg, cb);
  REQUIRE(hits == 0);
}

TEST_CASE("Parallel parameter sweep serializes callbacks") {
  using dickson::ClassificationRecord; using dickson::SweepConfig;
  using dickson::sweep_parameters;

  std::atomic<int> inside{0};
  std::atomic<bool> overlapped{false};
  unsigned hits = 0; // only touched inside the serialized callback
  auto cb = [&](std::uint32_t, std::uint32_t, std::uint64_t,
                const ClassificationRecord&) {
    if (inside.fetch_add(1) != 0) overlapped = true;
    ++hits;
    inside.fetch_sub(1);
  };

  SweepConfig cfg;
  cfg.progress_stride = 1;
  cfg.threads = 4;
  const unsigned p = 11;
  sweep_parameters(p, cfg, cb);
  REQUIRE(hits == p * (p * p - 1));
  REQUIRE_FALSE(overlapped.load());
}

TEST_CASE("Callback exceptions propagate out of a parallel sweep") {
  using dickson::ClassificationRecord; using dickson::SweepConfig;
  using dickson::sweep_parameters;

  auto cb = [](std::uint32_t, std::uint32_t a, std::uint64_t,
               const ClassificationRecord&) {
    if (a == 3) throw std::runtime_error("stop");
  };
  SweepConfig cfg;
  cfg.threads = 2;
  REQUIRE_THROWS_AS(sweep_parameters(5, cfg, cb), std::runtime_error);
}
