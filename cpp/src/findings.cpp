// src/findings.cpp
#include "dickson/findings.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <numeric> // std::gcd
#include <stdexcept>
#include <vector>

namespace dickson {

std::array<std::uint64_t, 3> cardinality_two_indices(std::uint32_t p) {
  if (p < 3 || (p & 1u) == 0)
    throw std::invalid_argument("cardinality-2 indices need an odd prime p");
  const std::uint64_t q = static_cast<std::uint64_t>(p) * p;
  return {(q + 1) / 2, q - 1, (q + 2 * static_cast<std::uint64_t>(p) - 1) / 2};
}

std::array<CardinalityTwoCheck, 3>
verify_cardinality_two(std::uint32_t p, std::uint32_t a, Variant variant) {
  const auto idx = cardinality_two_indices(p);
  std::array<CardinalityTwoCheck, 3> out;
  for (std::size_t i = 0; i < idx.size(); ++i) {
    out[i].n = idx[i];
    out[i].record =
        classify(p, a, static_cast<std::int64_t>(idx[i]), variant);
    out[i].holds = (out[i].record.cardinality == 2);
  }
  return out;
}

PermutationCriterionFinding
check_permutation_criterion(const ClassificationTable& table, std::uint32_t p,
                            std::uint32_t a) {
  const std::uint64_t period = static_cast<std::uint64_t>(p) * p - 1;

  PermutationCriterionFinding f;
  for (const auto& r : table.for_parameter(p, a)) {
    if (r.is_permutation)
      f.observed.push_back(r.n);
    if (std::gcd(r.n, period) == 1)
      f.predicted.push_back(r.n);
  }
  std::sort(f.observed.begin(), f.observed.end());
  std::sort(f.predicted.begin(), f.predicted.end());

  std::set_difference(f.observed.begin(), f.observed.end(),
                      f.predicted.begin(), f.predicted.end(),
                      std::back_inserter(f.observed_only));
  std::set_difference(f.predicted.begin(), f.predicted.end(),
                      f.observed.begin(), f.observed.end(),
                      std::back_inserter(f.predicted_only));
  return f;
}

ParameterInvarianceFinding parameter_invariance(const ClassificationTable& table,
                                                std::uint32_t p) {
  const auto params = table.parameters(p);
  const auto ref = std::find_if(params.begin(), params.end(),
                                [](std::uint32_t a) { return a != 0; });
  if (ref == params.end())
    throw std::invalid_argument("no nonzero parameter swept for p");

  ParameterInvarianceFinding f;
  f.reference_a = *ref;
  const auto baseline = table.cardinality_profile(p, f.reference_a);

  for (std::uint32_t a : params) {
    const bool same = (table.cardinality_profile(p, a) == baseline);
    if (a == 0) {
      f.zero_present = true;
      f.zero_matches = same;
    } else if (!same) {
      f.nonzero_invariant = false;
      f.divergent.push_back(a);
    }
  }
  return f;
}

} // namespace dickson
