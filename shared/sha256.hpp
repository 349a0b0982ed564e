#ifndef SHA256_HPP
#define SHA256_HPP

#include <array>
#include <cstdint>
#include <string>

using namespace std;

namespace semchunk {

class Sha256 {
  private:
    array<uint32_t, 8> state;
    array<uint8_t, 64> block;
    size_t block_len;
    uint64_t total_bits;

    void transform();
  public:
    Sha256();
    void update(const void* data, size_t len);
    array<uint8_t, 32> digest();
};

// Lower-case hex of the first `digest_bytes` bytes of SHA-256(data).
string sha256Hex(const string& data, size_t digest_bytes = 32);

} // namespace semchunk

#endif // SHA256_HPP
