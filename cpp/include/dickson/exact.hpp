// include/dickson/exact.hpp
#pragma once
#include <cstdint>
#include <string>

#include "dickson.hpp" // for dickson::Variant

namespace dickson {

// D_n(a, x) over the integers (no modulus), as a base-10 string.
// Uses GMP; the magnitude grows roughly like max(|a|, sqrt|x|)^n.
// Throws std::invalid_argument if n < 0.
std::string evaluate_exact(std::int64_t n, std::int64_t a, std::int64_t x,
                           Variant variant = Variant::Reversed);

} // namespace dickson
