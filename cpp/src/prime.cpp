// src/prime.cpp
#include "dickson/prime.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace dickson {
namespace {

inline std::uint64_t mod_mul(std::uint64_t a, std::uint64_t b,
                             std::uint64_t m) {
  return a * b % m; // operands < 2^32, so the product fits in 64 bits
}

inline std::uint64_t mod_pow(std::uint64_t a, std::uint64_t e,
                             std::uint64_t m) {
  std::uint64_t r = 1 % m;
  a %= m;
  while (e) {
    if (e & 1)
      r = mod_mul(r, a, m);
    a = mod_mul(a, a, m);
    e >>= 1;
  }
  return r;
}

// true if n passes the strong probable-prime test to base a
bool strong_probable_prime(std::uint32_t n, std::uint32_t a) {
  if (a % n == 0)
    return true;
  std::uint32_t d = n - 1;
  unsigned s = 0;
  while ((d & 1u) == 0) {
    d >>= 1;
    ++s;
  }
  std::uint64_t x = mod_pow(a, d, n);
  if (x == 1 || x == n - 1)
    return true;
  for (unsigned i = 1; i < s; ++i) {
    x = mod_mul(x, x, n);
    if (x == n - 1)
      return true;
  }
  return false;
}

} // namespace

bool is_prime(std::uint32_t p) noexcept {
  if (p == 2)
    return true;
  if (p < 2 || (p & 1u) == 0)
    return false;

  static constexpr std::uint32_t small[] = {3u,  5u,  7u,  11u, 13u, 17u,
                                            19u, 23u, 29u, 31u, 37u};
  for (std::uint32_t q : small) {
    if (p == q)
      return true;
    if (p % q == 0)
      return false;
  }

  // {2, 3, 5, 7} is exact below 3.2e9; 11 covers the rest of 32-bit.
  static constexpr std::uint32_t bases[] = {2u, 3u, 5u, 7u, 11u};
  for (std::uint32_t a : bases) {
    if (!strong_probable_prime(p, a))
      return false;
  }
  return true;
}

std::vector<std::uint32_t> primes_in_range(std::uint32_t lo,
                                           std::uint32_t hi) {
  if (lo > hi)
    throw std::invalid_argument("prime range lower bound exceeds upper bound");

  std::vector<std::uint32_t> out;
  if (hi < 2)
    return out;

  // Sieve over [0, hi]; the ranges here are small (p^2 - 1 sweeps dominate).
  std::vector<bool> composite(static_cast<std::size_t>(hi) + 1, false);
  for (std::uint64_t i = 2; i * i <= hi; ++i) {
    if (composite[i])
      continue;
    for (std::uint64_t j = i * i; j <= hi; j += i)
      composite[j] = true;
  }
  for (std::uint64_t i = (lo < 2 ? 2 : lo); i <= hi; ++i) {
    if (!composite[i])
      out.push_back(static_cast<std::uint32_t>(i));
  }
  return out;
}

} // namespace dickson
