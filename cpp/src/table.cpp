// src/table.cpp
#include "dickson/table.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dickson {
namespace {

template <typename Pred>
std::vector<ClassificationRecord>
filter_rows(const std::vector<ClassificationRecord>& rows, Pred keep) {
  std::vector<ClassificationRecord> out;
  for (const auto& r : rows) {
    if (keep(r))
      out.push_back(r);
  }
  return out;
}

template <typename Pred, typename Field>
std::vector<std::uint32_t>
distinct(const std::vector<ClassificationRecord>& rows, Pred keep, Field f) {
  std::set<std::uint32_t> seen;
  for (const auto& r : rows) {
    if (keep(r))
      seen.insert(f(r));
  }
  return {seen.begin(), seen.end()};
}

} // namespace

RecordTuple as_tuple(const ClassificationRecord& r) {
  return RecordTuple{r.p, r.n, r.a, r.cardinality, r.is_permutation, r.values};
}

void ClassificationTable::append(ClassificationRecord r) {
  rows_.push_back(std::move(r));
}

void ClassificationTable::append(std::vector<ClassificationRecord> rs) {
  rows_.reserve(rows_.size() + rs.size());
  for (auto& r : rs)
    rows_.push_back(std::move(r));
}

std::vector<ClassificationRecord>
ClassificationTable::for_prime(std::uint32_t p) const {
  return filter_rows(rows_,
                     [p](const ClassificationRecord& r) { return r.p == p; });
}

std::vector<ClassificationRecord>
ClassificationTable::for_parameter(std::uint32_t p, std::uint32_t a) const {
  return filter_rows(rows_, [p, a](const ClassificationRecord& r) {
    return r.p == p && r.a == a;
  });
}

std::vector<ClassificationRecord>
ClassificationTable::with_cardinality(std::uint32_t p, std::uint32_t c) const {
  return filter_rows(rows_, [p, c](const ClassificationRecord& r) {
    return r.p == p && r.cardinality == c;
  });
}

std::vector<ClassificationRecord>
ClassificationTable::permutations(std::uint32_t p) const {
  return filter_rows(rows_, [p](const ClassificationRecord& r) {
    return r.p == p && r.is_permutation;
  });
}

std::vector<std::uint32_t> ClassificationTable::primes() const {
  return distinct(
      rows_, [](const ClassificationRecord&) { return true; },
      [](const ClassificationRecord& r) { return r.p; });
}

std::vector<std::uint32_t>
ClassificationTable::parameters(std::uint32_t p) const {
  return distinct(
      rows_, [p](const ClassificationRecord& r) { return r.p == p; },
      [](const ClassificationRecord& r) { return r.a; });
}

std::vector<std::uint32_t>
ClassificationTable::observed_cardinalities(std::uint32_t p) const {
  return distinct(
      rows_, [p](const ClassificationRecord& r) { return r.p == p; },
      [](const ClassificationRecord& r) { return r.cardinality; });
}

std::vector<std::uint32_t>
ClassificationTable::observed_cardinalities(std::uint32_t p,
                                            std::uint32_t a) const {
  return distinct(
      rows_,
      [p, a](const ClassificationRecord& r) { return r.p == p && r.a == a; },
      [](const ClassificationRecord& r) { return r.cardinality; });
}

std::vector<std::uint32_t>
ClassificationTable::missing_cardinalities(std::uint32_t p) const {
  const auto seen = observed_cardinalities(p);
  std::vector<std::uint32_t> out;
  for (std::uint32_t c = 1; c < p; ++c) {
    if (!std::binary_search(seen.begin(), seen.end(), c))
      out.push_back(c);
  }
  return out;
}

std::vector<std::uint32_t>
ClassificationTable::cardinality_profile(std::uint32_t p,
                                         std::uint32_t a) const {
  std::vector<std::uint32_t> out;
  for (const auto& r : rows_) {
    if (r.p == p && r.a == a)
      out.push_back(r.cardinality);
  }
  std::sort(out.begin(), out.end());
  return out;
}

void write_csv(const ClassificationTable& table, std::ostream& out) {
  out << "p,n,a,value_count,is_permutation,value_set\n";
  for (const auto& r : table.records()) {
    out << r.p << ',' << r.n << ',' << r.a << ',' << r.cardinality << ','
        << (r.is_permutation ? "True" : "False") << ",\"[";
    for (std::size_t i = 0; i < r.values.size(); ++i) {
      if (i)
        out << ", ";
      out << r.values[i];
    }
    out << "]\"\n";
  }
}

void write_csv(const ClassificationTable& table, const std::string& path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f)
    throw std::runtime_error("cannot open output file: " + path);
  write_csv(table, f);
  f.flush();
  if (!f)
    throw std::runtime_error("write failed: " + path);
}

} // namespace dickson
