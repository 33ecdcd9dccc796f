// src/recurrence.cpp
#include "dickson/recurrence.hpp"

#include <cstdint>
#include <stdexcept>

namespace dickson {
namespace {

// (lead*d1 - trail*d0) mod p; every operand is already in [0, p), p < 2^32.
inline std::uint32_t next_term(std::uint64_t lead, std::uint64_t trail,
                               std::uint64_t d1, std::uint64_t d0,
                               std::uint64_t p) noexcept {
  const std::uint64_t plus = lead * d1 % p;
  const std::uint64_t minus = trail * d0 % p;
  return static_cast<std::uint32_t>(plus >= minus ? plus - minus
                                                  : plus + p - minus);
}

inline void require_modulus(std::uint32_t p) {
  if (p < 2)
    throw std::invalid_argument("modulus p must be >= 2");
}

} // namespace

const char* to_string(Variant v) noexcept {
  return v == Variant::Classical ? "classical" : "reversed";
}

std::uint32_t evaluate(std::int64_t n, std::uint32_t a, std::uint32_t x,
                       std::uint32_t p, Variant variant) {
  if (n < 0)
    throw std::invalid_argument("n must be non-negative");
  require_modulus(p);

  a %= p;
  x %= p;
  const std::uint32_t lead = (variant == Variant::Reversed) ? a : x;
  const std::uint32_t trail = (variant == Variant::Reversed) ? x : a;

  if (n == 0)
    return 2 % p;
  if (n == 1)
    return lead;

  // n - 1 steps from (D_0, D_1)
  std::uint32_t prev2 = 2 % p, prev1 = lead;
  for (std::int64_t i = 2; i <= n; ++i) {
    const std::uint32_t cur = next_term(lead, trail, prev1, prev2, p);
    prev2 = prev1;
    prev1 = cur;
  }
  return prev1;
}

RecurrenceStepper::RecurrenceStepper(std::uint32_t a, std::uint32_t x,
                                     std::uint32_t p, Variant variant)
    : p_(p) {
  require_modulus(p);
  a %= p;
  x %= p;
  lead_ = (variant == Variant::Reversed) ? a : x;
  trail_ = (variant == Variant::Reversed) ? x : a;
  cur_ = 2 % p;
  next_ = lead_;
}

void RecurrenceStepper::step() noexcept {
  const std::uint32_t t = next_term(lead_, trail_, next_, cur_, p_);
  cur_ = next_;
  next_ = t;
  ++n_;
}

void RecurrenceStepper::advance_to(std::uint64_t n) noexcept {
  while (n_ < n)
    step();
}

LockstepRecurrence::LockstepRecurrence(std::uint32_t a, std::uint32_t p,
                                       Variant variant)
    : p_(p), a_(0), variant_(variant) {
  require_modulus(p);
  a_ = a % p;
  slots_.resize(p);
  const std::uint32_t two = 2 % p;
  for (std::uint32_t x = 0; x < p; ++x) {
    slots_[x].cur = two;
    slots_[x].next = (variant == Variant::Reversed) ? a_ : x;
  }
}

void LockstepRecurrence::step() noexcept {
  // Branch on the variant once, outside the per-x loop.
  if (variant_ == Variant::Reversed) {
    for (std::uint32_t x = 0; x < p_; ++x) {
      Slot& s = slots_[x];
      const std::uint32_t t = next_term(a_, x, s.next, s.cur, p_);
      s.cur = s.next;
      s.next = t;
    }
  } else {
    for (std::uint32_t x = 0; x < p_; ++x) {
      Slot& s = slots_[x];
      const std::uint32_t t = next_term(x, a_, s.next, s.cur, p_);
      s.cur = s.next;
      s.next = t;
    }
  }
  ++n_;
}

} // namespace dickson
