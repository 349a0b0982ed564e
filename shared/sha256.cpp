#include "sha256.hpp"

#include <cstring>

namespace semchunk {

namespace {
constexpr array<uint32_t, 64> K = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u,
};

uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32u - n)); }
} // namespace

Sha256::Sha256()
    : state{0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
            0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u},
      block{},
      block_len(0),
      total_bits(0) {}

void Sha256::update(const void* data, size_t len) {
  const uint8_t* bytes = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; i++) {
    this->block[this->block_len++] = bytes[i];
    if (this->block_len == 64) {
      this->transform();
      this->total_bits += 512;
      this->block_len = 0;
    }
  }
}

array<uint8_t, 32> Sha256::digest() {
  uint64_t bit_len = this->total_bits + static_cast<uint64_t>(this->block_len) * 8u;

  size_t i = this->block_len;
  this->block[i++] = 0x80u;
  if (i > 56) {
    while (i < 64) this->block[i++] = 0u;
    this->transform();
    i = 0;
  }
  while (i < 56) this->block[i++] = 0u;
  for (int b = 7; b >= 0; b--) {
    this->block[i++] = static_cast<uint8_t>((bit_len >> (8u * b)) & 0xFFu);
  }
  this->transform();

  array<uint8_t, 32> out{};
  for (size_t w = 0; w < 8; w++) {
    out[w * 4] = static_cast<uint8_t>(this->state[w] >> 24u);
    out[w * 4 + 1] = static_cast<uint8_t>(this->state[w] >> 16u);
    out[w * 4 + 2] = static_cast<uint8_t>(this->state[w] >> 8u);
    out[w * 4 + 3] = static_cast<uint8_t>(this->state[w]);
  }
  return out;
}

void Sha256::transform() {
  array<uint32_t, 64> w{};
  for (size_t i = 0; i < 16; i++) {
    w[i] = (static_cast<uint32_t>(this->block[i * 4]) << 24u)
         | (static_cast<uint32_t>(this->block[i * 4 + 1]) << 16u)
         | (static_cast<uint32_t>(this->block[i * 4 + 2]) << 8u)
         | static_cast<uint32_t>(this->block[i * 4 + 3]);
  }
  for (size_t i = 16; i < 64; i++) {
    uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
    uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  uint32_t a = this->state[0], b = this->state[1], c = this->state[2], d = this->state[3];
  uint32_t e = this->state[4], f = this->state[5], g = this->state[6], h = this->state[7];

  for (size_t i = 0; i < 64; i++) {
    uint32_t t1 = h + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) + ((e & f) ^ (~e & g)) + K[i] + w[i];
    uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) + ((a & b) ^ (a & c) ^ (b & c));
    h = g; g = f; f = e; e = d + t1;
    d = c; c = b; b = a; a = t1 + t2;
  }

  this->state[0] += a; this->state[1] += b; this->state[2] += c; this->state[3] += d;
  this->state[4] += e; this->state[5] += f; this->state[6] += g; this->state[7] += h;
}

string sha256Hex(const string& data, size_t digest_bytes) {
  static constexpr char HEX[] = "0123456789abcdef";
  Sha256 sha;
  sha.update(data.data(), data.size());
  array<uint8_t, 32> digest = sha.digest();

  if (digest_bytes > digest.size()) digest_bytes = digest.size();
  string out;
  out.reserve(digest_bytes * 2);
  for (size_t i = 0; i < digest_bytes; i++) {
    out.push_back(HEX[digest[i] >> 4u]);
    out.push_back(HEX[digest[i] & 0xFu]);
  }
  return out;
}

} // namespace semchunk
