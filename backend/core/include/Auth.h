#pragma once
#include <string>
#include <vector>

namespace Auth {

enum class AuthResult {
  SUCCESS,
  INVALID_INPUT,
  WEAK_PASSWORD,
  USERNAME_TAKEN,
  EMAIL_TAKEN,
  INVALID_CREDENTIALS,
  ACCOUNT_LOCKED,
  SESSION_NOT_FOUND,
  SESSION_EXPIRED,
  SESSION_REVOKED,
  INVALID_RESET_TOKEN,
  USER_NOT_FOUND,
  UNAVAILABLE
};

// Outcome of an AuthService call. data is only meaningful on success;
// violations lists the failed rule names for INVALID_INPUT / WEAK_PASSWORD.
template <typename T> struct AuthResponse {
  AuthResult result;
  std::string message;
  T data;
  std::vector<std::string> violations;

  bool success() const { return result == AuthResult::SUCCESS; }
};

// Stable identifier for logs and the CLI, e.g. "ACCOUNT_LOCKED".
std::string AuthResultToString(AuthResult result);

// User-facing message for a result code. Every credential failure maps to
// the same text so the message never reveals which check failed.
std::string DefaultMessage(AuthResult result);

// Whether the caller may retry the same request later.
bool IsRetryable(AuthResult result);

template <typename T> AuthResponse<T> Fail(AuthResult result) {
  return AuthResponse<T>{result, DefaultMessage(result), T{}, {}};
}

template <typename T>
AuthResponse<T> Fail(AuthResult result, std::vector<std::string> violations) {
  return AuthResponse<T>{result, DefaultMessage(result), T{},
                         std::move(violations)};
}

template <typename T> AuthResponse<T> Ok(T data, const std::string &message = "OK") {
  return AuthResponse<T>{AuthResult::SUCCESS, message, std::move(data), {}};
}

} // namespace Auth
