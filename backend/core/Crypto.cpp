#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sodium.h>

// Standard library headers
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Project headers
#include "Crypto.h"

namespace Crypto {

// === Random Number Generation ===
bool RandBytes(void* buf, size_t len) {
    if (len == 0)
        return true;
    return RAND_bytes(static_cast<unsigned char*>(buf), static_cast<int>(len)) == 1;
}

std::string GenerateSecureRandomString(size_t byteLength) {
    std::vector<uint8_t> buffer(byteLength);
    if (!RandBytes(buffer.data(), buffer.size())) {
        throw std::runtime_error("CSPRNG failure while generating random string");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto& byte : buffer) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string GenerateUrlSafeToken(size_t byteLength) {
    std::vector<uint8_t> buffer(byteLength);
    if (!RandBytes(buffer.data(), buffer.size())) {
        throw std::runtime_error("CSPRNG failure while generating token");
    }

    std::string token = B64UrlEncode(buffer);
    SecureWipeVector(buffer);
    return token;
}

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t>& data) {
    if (data.empty())
        return {};
    int outLen = 4 * ((data.size() + 2) / 3);
    std::string out(outLen + 1, '\0');
    int ret = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                              static_cast<int>(data.size()));
    if (ret < 0)
        return {};
    // EVP_EncodeBlock writes a trailing NUL that is not part of the encoding
    out.resize(ret);
    return out;
}

std::vector<uint8_t> B64Decode(const std::string& s) {
    if (s.empty() || s.size() % 4 != 0)
        return {};
    int outLen = 3 * (s.size() / 4);
    std::vector<uint8_t> out(outLen);
    int ret = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.c_str()),
                              static_cast<int>(s.size()));
    if (ret < 0)
        return {};

    // Padding adjustment
    int padding = 0;
    if (s.size() > 0 && s[s.size() - 1] == '=')
        padding++;
    if (s.size() > 1 && s[s.size() - 2] == '=')
        padding++;
    out.resize(ret - padding);
    return out;
}

std::string B64UrlEncode(const std::vector<uint8_t>& data) {
    std::string out = B64Encode(data);
    while (!out.empty() && out.back() == '=')
        out.pop_back();
    for (auto& c : out) {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }
    return out;
}

// === Key Derivation Functions ===
bool PBKDF2_HMAC_SHA256(const std::string& password, const uint8_t* salt, size_t salt_len,
                        uint32_t iterations, std::vector<uint8_t>& out_key, size_t dk_len) {
    if (iterations == 0 || dk_len == 0)
        return false;
    if (iterations > static_cast<uint32_t>(std::numeric_limits<int>::max()))
        return false;

    out_key.assign(dk_len, 0);
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt,
                               static_cast<int>(salt_len), static_cast<int>(iterations),
                               EVP_sha256(), static_cast<int>(dk_len), out_key.data());
    if (ok != 1) {
        SecureWipeVector(out_key);
        return false;
    }
    return true;
}

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size())
        return false;
    if (a.empty())
        return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size())
        return false;
    if (a.empty())
        return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// === Memory Security Functions ===
void SecureClear(void* ptr, size_t size) {
    if (!ptr || size == 0)
        return;

    static std::once_flag sodiumInit;
    static bool sodiumReady = false;
    std::call_once(sodiumInit, [] { sodiumReady = sodium_init() >= 0; });

    if (!sodiumReady) {
        OPENSSL_cleanse(ptr, size);
        return;
    }
    sodium_memzero(ptr, size);
}

void SecureWipeVector(std::vector<uint8_t>& vec) {
    if (!vec.empty()) {
        SecureClear(vec.data(), vec.size());
        vec.clear();
        vec.shrink_to_fit();
    }
}

void SecureWipeString(std::string& str) {
    if (!str.empty()) {
        SecureClear(&str[0], str.size());
        str.clear();
        str.shrink_to_fit();
    }
}

} // namespace Crypto
