#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {

// === Random Number Generation ===
bool RandBytes(void *buf, size_t len);

// Hex string of byteLength random bytes; throws std::runtime_error if the CSPRNG fails
std::string GenerateSecureRandomString(size_t byteLength);

// URL-safe base64 (no padding) of byteLength random bytes; throws on CSPRNG failure
std::string GenerateUrlSafeToken(size_t byteLength);

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t> &data);
std::vector<uint8_t> B64Decode(const std::string &s);
std::string B64UrlEncode(const std::vector<uint8_t> &data);

// === Key Derivation Functions ===
bool PBKDF2_HMAC_SHA256(const std::string &password, const uint8_t *salt, size_t salt_len,
                        uint32_t iterations, std::vector<uint8_t> &out_key, size_t dk_len = 32);

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b);
bool ConstantTimeEquals(const std::string &a, const std::string &b);

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size);
void SecureWipeVector(std::vector<uint8_t> &vec);
void SecureWipeString(std::string &str);

} // namespace Crypto
