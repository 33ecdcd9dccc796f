// include/dickson/table.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <tuple>
#include <vector>

#include "dickson.hpp"

namespace dickson {

// (p, n, a, cardinality, is_permutation, values): the plain row shape handed
// to whatever sink stores the table.
using RecordTuple = std::tuple<std::uint32_t, std::uint64_t, std::uint32_t,
                               std::uint32_t, bool, std::vector<std::uint32_t>>;

RecordTuple as_tuple(const ClassificationRecord& r);

// Append-only table of classification records in sweep order.
// Every query is a filter or a tally over stored rows; nothing is recomputed.
class ClassificationTable {
public:
  void append(ClassificationRecord r);
  void append(std::vector<ClassificationRecord> rs);

  const std::vector<ClassificationRecord>& records() const noexcept {
    return rows_;
  }
  std::size_t size() const noexcept { return rows_.size(); }
  bool empty() const noexcept { return rows_.empty(); }

  std::vector<ClassificationRecord> for_prime(std::uint32_t p) const;
  std::vector<ClassificationRecord> for_parameter(std::uint32_t p,
                                                  std::uint32_t a) const;
  std::vector<ClassificationRecord> with_cardinality(std::uint32_t p,
                                                     std::uint32_t c) const;
  std::vector<ClassificationRecord> permutations(std::uint32_t p) const;

  // Sorted distinct primes / parameters present.
  std::vector<std::uint32_t> primes() const;
  std::vector<std::uint32_t> parameters(std::uint32_t p) const;

  // Sorted distinct cardinalities seen for p (optionally one a).
  std::vector<std::uint32_t> observed_cardinalities(std::uint32_t p) const;
  std::vector<std::uint32_t> observed_cardinalities(std::uint32_t p,
                                                    std::uint32_t a) const;
  // Members of {1, ..., p-1} never observed for p.
  std::vector<std::uint32_t> missing_cardinalities(std::uint32_t p) const;
  // Sorted multiset of cardinalities over every n swept for (p, a).
  std::vector<std::uint32_t> cardinality_profile(std::uint32_t p,
                                                 std::uint32_t a) const;

private:
  std::vector<ClassificationRecord> rows_;
};

// Delimited-text sink. Header: p,n,a,value_count,is_permutation,value_set
// value_set is written as a quoted list, e.g. "[1, 2]"; flags as True/False.
void write_csv(const ClassificationTable& table, std::ostream& out);
// Throws std::runtime_error if the file cannot be opened or written.
void write_csv(const ClassificationTable& table, const std::string& path);

} // namespace dickson
