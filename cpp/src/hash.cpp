// src/hash.cpp
#include "dickson/hash.hpp"

#include <algorithm> // std::min
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace dickson {
namespace {

inline constexpr std::uint32_t rotr(std::uint32_t x, int n) {
  return (x >> n) | (x << (32 - n));
}

inline std::uint32_t load_be32(const unsigned char* p) {
  return (std::uint32_t)p[0] << 24 | (std::uint32_t)p[1] << 16 |
         (std::uint32_t)p[2] << 8 | (std::uint32_t)p[3];
}

// Streaming SHA-256: records are fed one at a time, so the table never has to
// be serialized into a single buffer first.
class Sha256 {
public:
  void update(const void* data, std::size_t len) {
    const auto* in = static_cast<const unsigned char*>(data);
    total_ += len;
    while (len > 0) {
      const std::size_t take = std::min(len, sizeof(block_) - used_);
      std::memcpy(block_ + used_, in, take);
      used_ += take;
      in += take;
      len -= take;
      if (used_ == sizeof(block_)) {
        compress(block_);
        used_ = 0;
      }
    }
  }

  void put_u8(std::uint8_t v) { update(&v, 1); }

  void put_u32(std::uint32_t v) {
    unsigned char b[4];
    for (int i = 0; i < 4; ++i)
      b[i] = (unsigned char)(v >> (8 * i));
    update(b, sizeof(b));
  }

  void put_u64(std::uint64_t v) {
    unsigned char b[8];
    for (int i = 0; i < 8; ++i)
      b[i] = (unsigned char)(v >> (8 * i));
    update(b, sizeof(b));
  }

  TableDigest finish() {
    const std::uint64_t bits = total_ * 8;
    block_[used_++] = 0x80;
    if (used_ > 56) { // length does not fit; pad out this block
      std::memset(block_ + used_, 0, 64 - used_);
      compress(block_);
      used_ = 0;
    }
    std::memset(block_ + used_, 0, 56 - used_);
    for (int i = 0; i < 8; ++i)
      block_[63 - i] = (unsigned char)(bits >> (8 * i));
    compress(block_);

    TableDigest d;
    for (int i = 0; i < 8; ++i) {
      d.bytes[4 * i] = (std::uint8_t)(H_[i] >> 24);
      d.bytes[4 * i + 1] = (std::uint8_t)(H_[i] >> 16);
      d.bytes[4 * i + 2] = (std::uint8_t)(H_[i] >> 8);
      d.bytes[4 * i + 3] = (std::uint8_t)(H_[i]);
    }
    return d;
  }

private:
  void compress(const unsigned char* b) {
    static constexpr std::uint32_t K[64] = {
        0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
        0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
        0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
        0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
        0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
        0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
        0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
        0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
        0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
        0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
        0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
        0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
        0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

    std::uint32_t w[64];
    for (int i = 0; i < 16; ++i)
      w[i] = load_be32(b + 4 * i);
    for (int i = 16; i < 64; ++i) {
      std::uint32_t s0 =
          rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
      std::uint32_t s1 =
          rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
      w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::uint32_t v[8];
    std::memcpy(v, H_, sizeof(v));
    for (int i = 0; i < 64; ++i) {
      std::uint32_t S1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
      std::uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
      std::uint32_t t1 = v[7] + S1 + ch + K[i] + w[i];
      std::uint32_t S0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
      std::uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
      // rotate the working variables down by one
      std::memmove(v + 1, v, 7 * sizeof(std::uint32_t));
      v[4] += t1;
      v[0] = t1 + S0 + maj;
    }
    for (int i = 0; i < 8; ++i)
      H_[i] += v[i];
  }

  std::uint32_t H_[8] = {0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
                         0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};
  unsigned char block_[64] = {};
  std::size_t used_ = 0;
  std::uint64_t total_ = 0;
};

} // namespace

bool operator==(const TableDigest& lhs, const TableDigest& rhs) noexcept {
  return lhs.bytes == rhs.bytes;
}

bool operator!=(const TableDigest& lhs, const TableDigest& rhs) noexcept {
  return !(lhs == rhs);
}

TableDigest make_digest(const void* data, std::size_t nbytes) noexcept {
  Sha256 h;
  h.update(data, nbytes);
  return h.finish();
}

TableDigest make_digest(const std::string& s) noexcept {
  return make_digest(s.data(), s.size());
}

TableDigest make_table_digest(const std::vector<ClassificationRecord>& records) {
  Sha256 h;
  for (const auto& r : records) {
    h.put_u32(r.p);
    h.put_u32(r.a);
    h.put_u64(r.n);
    h.put_u32(r.cardinality);
    h.put_u8(r.is_permutation ? 1 : 0);
    h.put_u32(static_cast<std::uint32_t>(r.values.size()));
    for (std::uint32_t v : r.values)
      h.put_u32(v);
  }
  return h.finish();
}

std::string to_hex(const TableDigest& d) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(d.bytes.size() * 2);
  for (std::size_t i = 0; i < d.bytes.size(); ++i) {
    out[2 * i] = hex[(d.bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[d.bytes[i] & 0xF];
  }
  return out;
}

} // namespace dickson
