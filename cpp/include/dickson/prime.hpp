// include/dickson/prime.hpp
#pragma once
#include <cstdint>
#include <vector>

namespace dickson {

// Deterministic primality for 32-bit moduli. Returns true iff p is prime.
// Trial division by small primes, then Miller–Rabin with a base set that is
// exact below 2^32.
bool is_prime(std::uint32_t p) noexcept;

// All primes in [lo, hi], ascending (sieve of Eratosthenes).
// Throws std::invalid_argument if lo > hi.
std::vector<std::uint32_t> primes_in_range(std::uint32_t lo, std::uint32_t hi);

} // namespace dickson
