// include/dickson/findings.hpp
#pragma once
#include <array>
#include <cstdint>
#include <vector>

#include "dickson.hpp"
#include "table.hpp"

namespace dickson {

// Closed-form checks against computed value sets. A check that does not hold
// is reported in the returned struct; it is a result, not an error.

// The three indices (p^2+1)/2, p^2-1, (p^2+2p-1)/2 whose value sets under
// D_n(1, x) have two elements. Throws std::invalid_argument unless p is odd
// and >= 3.
std::array<std::uint64_t, 3> cardinality_two_indices(std::uint32_t p);

struct CardinalityTwoCheck {
  std::uint64_t n = 0;
  ClassificationRecord record;
  bool holds = false; // record.cardinality == 2
};

// classify() at each of cardinality_two_indices(p).
std::array<CardinalityTwoCheck, 3>
verify_cardinality_two(std::uint32_t p, std::uint32_t a = 1,
                       Variant variant = Variant::Reversed);

// Permutation indices observed in the table for (p, a) against the indices
// n with gcd(n, p^2-1) == 1 over the same swept n.
struct PermutationCriterionFinding {
  std::vector<std::uint64_t> observed;
  std::vector<std::uint64_t> predicted;
  std::vector<std::uint64_t> observed_only;
  std::vector<std::uint64_t> predicted_only;
  bool holds() const noexcept {
    return observed_only.empty() && predicted_only.empty();
  }
};

PermutationCriterionFinding
check_permutation_criterion(const ClassificationTable& table, std::uint32_t p,
                            std::uint32_t a);

// Compares every parameter's cardinality profile for p against the smallest
// nonzero parameter present. Throws std::invalid_argument if the table has no
// nonzero parameter for p.
struct ParameterInvarianceFinding {
  std::uint32_t reference_a = 0;
  bool nonzero_invariant = true;           // all nonzero a share the profile
  bool zero_present = false;
  bool zero_matches = false;               // a == 0 shares it too
  std::vector<std::uint32_t> divergent;    // nonzero a that differ
};

ParameterInvarianceFinding parameter_invariance(const ClassificationTable& table,
                                                std::uint32_t p);

} // namespace dickson
