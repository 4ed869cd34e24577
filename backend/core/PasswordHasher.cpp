#include "PasswordHasher.h"
#include "Crypto.h"

#include <stdexcept>

namespace Auth {

PasswordHasher::PasswordHasher(uint32_t defaultIterations)
    : m_defaultIterations(defaultIterations) {
  if (m_defaultIterations == 0) {
    throw std::invalid_argument("PBKDF2 iteration count must be positive");
  }
}

std::string PasswordHasher::hash(const std::string &password,
                                 const std::vector<uint8_t> &salt,
                                 uint32_t iterations) const {
  if (salt.empty()) {
    throw std::invalid_argument("Password salt must not be empty");
  }
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iteration count must be positive");
  }

  std::vector<uint8_t> dk;
  if (!Crypto::PBKDF2_HMAC_SHA256(password, salt.data(), salt.size(),
                                  iterations, dk, KEY_LENGTH)) {
    throw std::runtime_error("PBKDF2-HMAC-SHA256 derivation failed");
  }

  std::string digest = Crypto::B64Encode(dk);
  Crypto::SecureWipeVector(dk);
  if (digest.empty()) {
    throw std::runtime_error("Failed to encode password digest");
  }
  return digest;
}

std::vector<uint8_t> PasswordHasher::generateSalt() const {
  std::vector<uint8_t> salt(SALT_SIZE);
  if (!Crypto::RandBytes(salt.data(), salt.size())) {
    throw std::runtime_error("CSPRNG failure while generating salt");
  }
  return salt;
}

bool PasswordHasher::verify(const std::string &password,
                            const std::vector<uint8_t> &salt,
                            uint32_t iterations,
                            const std::string &digest) const {
  std::string candidate = hash(password, salt, iterations);
  bool matches = Crypto::ConstantTimeEquals(candidate, digest);
  Crypto::SecureWipeString(candidate);
  return matches;
}

} // namespace Auth
