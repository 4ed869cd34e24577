#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Auth {

// Salted PBKDF2-HMAC-SHA256 password digests.
//
// Digests are the base64 encoding of a 32-byte derived key. The iteration
// count is stored next to each digest so it can be raised over time; see
// needsRehash(). Every method throws std::runtime_error if OpenSSL fails,
// never degrading to a weaker source.
class PasswordHasher {
public:
  static constexpr uint32_t DEFAULT_ITERATIONS = 100000;
  static constexpr size_t SALT_SIZE = 32;
  static constexpr size_t KEY_LENGTH = 32;

  explicit PasswordHasher(uint32_t defaultIterations = DEFAULT_ITERATIONS);

  std::string hash(const std::string &password,
                   const std::vector<uint8_t> &salt,
                   uint32_t iterations) const;

  std::vector<uint8_t> generateSalt() const;

  // Recomputes the digest and compares it in constant time.
  bool verify(const std::string &password, const std::vector<uint8_t> &salt,
              uint32_t iterations, const std::string &digest) const;

  bool needsRehash(uint32_t storedIterations) const {
    return storedIterations < m_defaultIterations;
  }

  uint32_t defaultIterations() const { return m_defaultIterations; }

private:
  uint32_t m_defaultIterations;
};

} // namespace Auth
