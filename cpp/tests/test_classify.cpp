#include "dickson/dickson.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

using Values = std::vector<std::uint32_t>;

TEST_CASE("p = 7 trivial value sets") {
  using dickson::classify;
  auto r0 = classify(7, 1, 0);
  REQUIRE(r0.values == Values{2});
  REQUIRE(r0.cardinality == 1);
  REQUIRE_FALSE(r0.is_permutation);

  REQUIRE(classify(7, 1, 1).values == Values{1});
  REQUIRE(classify(7, 1, 7).values == Values{1});
}

TEST_CASE("p = 5 cardinality-2 indices") {
  using dickson::classify;
  // (p^2+1)/2, (p^2+2p-1)/2, p^2-1
  auto r13 = classify(5, 1, 13);
  auto r17 = classify(5, 1, 17);
  auto r24 = classify(5, 1, 24);
  REQUIRE(r13.cardinality == 2);
  REQUIRE(r17.cardinality == 2);
  REQUIRE(r24.cardinality == 2);
  REQUIRE(r13.values == Values{1, 4});
  REQUIRE(r17.values == Values{1, 4});
  REQUIRE(r24.values == Values{1, 2});

  REQUIRE(classify(5, 1, 12).values == Values{1, 2, 3});
}

TEST_CASE("D_{p^2-1}(1, x) collapses to {1, 2}") {
  using dickson::classify;
  for (auto p : {3u, 5u, 7u, 11u, 13u, 17u, 19u, 23u}) {
    auto r = classify(p, 1, (std::int64_t)p * p - 1);
    REQUIRE(r.cardinality == 2);
    REQUIRE(std::binary_search(r.values.begin(), r.values.end(), 2u));
    REQUIRE(r.values == Values{1, 2}); // x = 0 gives D_n(1, 0) = 1
  }
}

TEST_CASE("Record fields are consistent") {
  using dickson::classify;
  for (auto p : {2u, 3u, 5u, 7u}) {
    for (std::uint32_t a = 0; a < p; ++a) {
      for (std::int64_t n = 0; n < (std::int64_t)(p * p); ++n) {
        auto r = classify(p, a, n);
        REQUIRE(r.p == p);
        REQUIRE(r.a == a);
        REQUIRE(r.n == (std::uint64_t)n);
        REQUIRE(r.cardinality >= 1);
        REQUIRE(r.cardinality <= p);
        REQUIRE(r.values.size() == r.cardinality);
        REQUIRE(std::is_sorted(r.values.begin(), r.values.end()));
        REQUIRE(std::adjacent_find(r.values.begin(), r.values.end()) ==
                r.values.end());
        REQUIRE(r.values.back() < p);
        REQUIRE(r.is_permutation == (r.cardinality == p));
      }
    }
  }
}

TEST_CASE("Parameter is stored reduced") {
  auto r = dickson::classify(5, 6, 2);
  REQUIRE(r.a == 1);
  REQUIRE(r == dickson::classify(5, 1, 2));
}

TEST_CASE("Known permutation indices for a = 1") {
  using dickson::classify;
  // D_2(1, x) = 1 - 2x and D_3(1, x) = 1 - 3x are affine bijections.
  REQUIRE(classify(5, 1, 2).is_permutation);
  REQUIRE(classify(5, 1, 3).is_permutation);
  REQUIRE(classify(7, 1, 9).is_permutation);
  REQUIRE_FALSE(classify(5, 1, 7).is_permutation);
}

TEST_CASE("a = 0 runs through the same recurrence") {
  using dickson::classify;
  // D_n(0, x) is 2(-x)^{n/2} for even n and 0 for odd n.
  REQUIRE(classify(5, 0, 1).values == Values{0});
  REQUIRE(classify(5, 0, 3).values == Values{0});
  REQUIRE(classify(5, 0, 2).is_permutation);
  REQUIRE(classify(5, 0, 4).values == Values{0, 2, 3});
}

TEST_CASE("Classical variant value sets") {
  using dickson::classify;
  using dickson::Variant;
  // E_1(x, a) = x is the identity map.
  REQUIRE(classify(11, 3, 1, Variant::Classical).is_permutation);
  REQUIRE(classify(11, 3, 0, Variant::Classical).values == Values{2});
}

TEST_CASE("Reject invalid classification arguments") {
  using dickson::classify;
  REQUIRE_THROWS_AS(classify(5, 1, -1), std::invalid_argument);
  REQUIRE_THROWS_AS(classify(0, 1, 3), std::invalid_argument);
  REQUIRE_THROWS_AS(classify(1, 0, 0), std::invalid_argument);
}
