#include "dickson/dickson.hpp"
#include "dickson/findings.hpp"
#include "dickson/table.hpp"
#include <catch2/catch_test_macros.hpp>
#include <array>
#include <stdexcept>
#include <vector>

TEST_CASE("Cardinality-2 index formulas") {
  using dickson::cardinality_two_indices;
  REQUIRE(cardinality_two_indices(5) == std::array<std::uint64_t, 3>{13, 24, 17});
  REQUIRE(cardinality_two_indices(7) == std::array<std::uint64_t, 3>{25, 48, 31});
  REQUIRE_THROWS_AS(cardinality_two_indices(2), std::invalid_argument);
  REQUIRE_THROWS_AS(cardinality_two_indices(4), std::invalid_argument);
}

TEST_CASE("Cardinality-2 value sets for a = 1") {
  using U = std::vector<std::uint32_t>;
  for (auto p : {5u, 7u, 11u, 13u, 17u, 19u, 23u, 29u}) {
    auto checks = dickson::verify_cardinality_two(p);
    for (const auto& c : checks) {
      REQUIRE(c.holds);
      REQUIRE(c.record.n == c.n);
    }
    REQUIRE(checks[0].record.values == U{1, p - 1});
    REQUIRE(checks[1].record.values == U{1, 2});
    REQUIRE(checks[2].record.values == U{1, p - 1});
  }
  // Any nonzero a keeps the cardinality, with scaled values.
  auto scaled = dickson::verify_cardinality_two(7, 2);
  REQUIRE(scaled[0].holds);
  REQUIRE(scaled[0].record.values == U{2, 5});
}

TEST_CASE("gcd criterion: holds for the classical variant") {
  using dickson::SweepConfig; using dickson::Variant;
  SweepConfig cfg;
  cfg.variant = Variant::Classical;
  dickson::ClassificationTable t;
  for (auto p : {5u, 7u, 11u}) t.append(dickson::sweep(p, 1, cfg));

  for (auto p : {5u, 7u, 11u}) {
    auto f = dickson::check_permutation_criterion(t, p, 1);
    REQUIRE(f.holds());
    REQUIRE(f.observed == f.predicted);
  }
  REQUIRE(dickson::check_permutation_criterion(t, 5, 1).observed ==
          std::vector<std::uint64_t>{1, 5, 7, 11, 13, 17, 19, 23});
}

TEST_CASE("gcd criterion: reversed variant diverges and is reported") {
  using N = std::vector<std::uint64_t>;
  dickson::ClassificationTable t;
  t.append(dickson::sweep(5, 1));

  auto f = dickson::check_permutation_criterion(t, 5, 1);
  REQUIRE_FALSE(f.holds());
  REQUIRE(f.observed == N{2, 3, 6, 10, 15});
  REQUIRE(f.predicted == N{1, 5, 7, 11, 13, 17, 19, 23});
  REQUIRE(f.observed_only == f.observed);
  REQUIRE(f.predicted_only == f.predicted);

  // Nothing swept for this parameter: nothing to compare.
  auto empty = dickson::check_permutation_criterion(t, 5, 2);
  REQUIRE(empty.holds());
  REQUIRE(empty.observed.empty());
}

TEST_CASE("Parameter invariance across a") {
  dickson::ClassificationTable t;
  for (auto p : {3u, 5u, 7u}) t.append(dickson::sweep_parameters(p));

  for (auto p : {3u, 5u, 7u}) {
    auto f = dickson::parameter_invariance(t, p);
    REQUIRE(f.reference_a == 1);
    REQUIRE(f.nonzero_invariant);
    REQUIRE(f.divergent.empty());
    REQUIRE(f.zero_present);
    REQUIRE_FALSE(f.zero_matches);
  }
}

TEST_CASE("Parameter invariance with a partial sweep") {
  dickson::ClassificationTable t;
  t.append(dickson::sweep(7, 3));
  t.append(dickson::sweep(7, 5));
  auto f = dickson::parameter_invariance(t, 7);
  REQUIRE(f.reference_a == 3);
  REQUIRE(f.nonzero_invariant);
  REQUIRE_FALSE(f.zero_present);

  dickson::ClassificationTable zero_only;
  zero_only.append(dickson::sweep(7, 0));
  REQUIRE_THROWS_AS(dickson::parameter_invariance(zero_only, 7),
                    std::invalid_argument);
}
