// include/dickson/recurrence.hpp
#pragma once
#include <cstdint>
#include <vector>

#include "dickson.hpp" // for dickson::Variant

namespace dickson {

// D_n(a, x) mod p by the order-2 recurrence, O(n) time and O(1) space.
// a and x are reduced mod p first. a == 0 is not special-cased.
// Throws std::invalid_argument if n < 0 or p < 2.
std::uint32_t evaluate(std::int64_t n, std::uint32_t a, std::uint32_t x,
                       std::uint32_t p, Variant variant = Variant::Reversed);

// Running pair for one (a, x): holds (D_n, D_{n+1}) so that moving from n to
// n+1 costs one multiply-subtract instead of a restart from n = 0.
class RecurrenceStepper {
public:
  RecurrenceStepper(std::uint32_t a, std::uint32_t x, std::uint32_t p,
                    Variant variant = Variant::Reversed);

  std::uint64_t index() const noexcept { return n_; }
  std::uint32_t value() const noexcept { return cur_; }

  void step() noexcept;
  void advance_to(std::uint64_t n) noexcept; // no-op if n <= index()

private:
  std::uint32_t p_;
  std::uint32_t lead_;
  std::uint32_t trail_;
  std::uint64_t n_ = 0;
  std::uint32_t cur_;  // D_n
  std::uint32_t next_; // D_{n+1}
};

// p running pairs, one per x in F_p, advanced together one n per step().
// Slots are allocated once; step() does not allocate.
class LockstepRecurrence {
public:
  struct Slot {
    std::uint32_t cur;  // D_n(a, x)
    std::uint32_t next; // D_{n+1}(a, x)
  };

  LockstepRecurrence(std::uint32_t a, std::uint32_t p,
                     Variant variant = Variant::Reversed);

  std::uint32_t modulus() const noexcept { return p_; }
  std::uint32_t parameter() const noexcept { return a_; }
  std::uint64_t index() const noexcept { return n_; }
  std::uint32_t value(std::uint32_t x) const { return slots_[x].cur; }
  const std::vector<Slot>& slots() const noexcept { return slots_; }

  void step() noexcept;

private:
  std::uint32_t p_;
  std::uint32_t a_;
  Variant variant_;
  std::uint64_t n_ = 0;
  std::vector<Slot> slots_;
};

} // namespace dickson
