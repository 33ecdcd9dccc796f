// include/dickson/hash.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dickson.hpp" // for dickson::ClassificationRecord

namespace dickson {

// Fixed-size digest of a run of records (stable across runs and platforms).
struct TableDigest {
  std::array<std::uint8_t, 32> bytes{}; // SHA-256
};

bool operator==(const TableDigest& lhs, const TableDigest& rhs) noexcept;
bool operator!=(const TableDigest& lhs, const TableDigest& rhs) noexcept;

// Digest over raw bytes.
TableDigest make_digest(const void* data, std::size_t nbytes) noexcept;
TableDigest make_digest(const std::string& s) noexcept;

// Digest over a canonical little-endian encoding of the records:
// p:u32 a:u32 n:u64 cardinality:u32 is_permutation:u8 count:u32 values:u32*.
// Two sweeps agree byte for byte iff their digests agree.
TableDigest make_table_digest(const std::vector<ClassificationRecord>& records);

// Hex encoding for logs and the CLI summary.
std::string to_hex(const TableDigest& d);

} // namespace dickson
