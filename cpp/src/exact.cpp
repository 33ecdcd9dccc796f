// src/exact.cpp
#include "dickson/exact.hpp"

#include <cstdint>
#include <cstring>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace dickson {

std::string evaluate_exact(std::int64_t n, std::int64_t a, std::int64_t x,
                           Variant variant) {
  if (n < 0)
    throw std::invalid_argument("n must be non-negative");
  if (n == 0)
    return "2";

  const std::int64_t lead = (variant == Variant::Reversed) ? a : x;
  const std::int64_t trail = (variant == Variant::Reversed) ? x : a;

  mpz_t L, T, prev2, prev1, tmp;
  mpz_init(L);
  mpz_init(T);
  mpz_init(prev2);
  mpz_init(prev1);
  mpz_init(tmp);

  mpz_set_si(L, static_cast<long>(lead));
  mpz_set_si(T, static_cast<long>(trail));
  mpz_set_ui(prev2, 2);
  mpz_set(prev1, L);

  // D_i = lead*D_{i-1} - trail*D_{i-2}
  for (std::int64_t i = 2; i <= n; ++i) {
    mpz_mul(tmp, L, prev1);
    mpz_submul(tmp, T, prev2);
    mpz_swap(prev2, prev1); // prev2 <- D_{i-1}
    mpz_swap(prev1, tmp);   // prev1 <- D_i
  }

  // mpz_sizeinbase may overshoot by one; +2 covers the sign and the NUL.
  std::string out(mpz_sizeinbase(prev1, 10) + 2, '\0');
  mpz_get_str(&out[0], 10, prev1);
  out.resize(std::strlen(out.c_str()));

  mpz_clear(L);
  mpz_clear(T);
  mpz_clear(prev2);
  mpz_clear(prev1);
  mpz_clear(tmp);

  return out;
}

} // namespace dickson
