#ifndef FNV1A_HPP
#define FNV1A_HPP

#include "ihashcalculator.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

/**
 * @brief 64-bit FNV-1a (Fowler-Noll-Vo) hash used for backup checksums
 *
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * Files are read in fixed-size chunks so large media files do not have to
 * fit in memory. Digests are rendered as 16 upper-case hex digits.
 *
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A : public IHashCalculator {
public:
  static constexpr uint64_t OFFSET_BASIS = 1469598103934665603u;
  static constexpr uint64_t PRIME = 1099511628211u;
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

  /**
   * @brief Folds @p size bytes into a running hash value
   */
  static uint64_t update(uint64_t hash, const char *data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
      hash ^= static_cast<unsigned char>(data[i]);
      hash *= PRIME;
    }
    return hash;
  }

  static std::string toHex(uint64_t hash) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
  }

  /**
   * @return Hex digest, or an empty string if the file cannot be read
   */
  std::string calculateHash(const std::string &filePath) const override {
    std::ifstream file(filePath, std::ios::binary);

    if (!file)
      return "";

    uint64_t hash = OFFSET_BASIS;
    std::vector<char> buffer(CHUNK_SIZE);
    while (file) {
      file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = file.gcount();
      if (got > 0)
        hash = update(hash, buffer.data(), static_cast<std::size_t>(got));
    }

    if (file.bad())
      return "";

    return toHex(hash);
  }

  std::string calculateDataHash(const std::string &data) const override {
    return toHex(update(OFFSET_BASIS, data.data(), data.size()));
  }
};

#endif // FNV1A_HPP
