#include "Auth.h"

namespace Auth {

std::string AuthResultToString(AuthResult result) {
  switch (result) {
  case AuthResult::SUCCESS:
    return "SUCCESS";
  case AuthResult::INVALID_INPUT:
    return "INVALID_INPUT";
  case AuthResult::WEAK_PASSWORD:
    return "WEAK_PASSWORD";
  case AuthResult::USERNAME_TAKEN:
    return "USERNAME_TAKEN";
  case AuthResult::EMAIL_TAKEN:
    return "EMAIL_TAKEN";
  case AuthResult::INVALID_CREDENTIALS:
    return "INVALID_CREDENTIALS";
  case AuthResult::ACCOUNT_LOCKED:
    return "ACCOUNT_LOCKED";
  case AuthResult::SESSION_NOT_FOUND:
    return "SESSION_NOT_FOUND";
  case AuthResult::SESSION_EXPIRED:
    return "SESSION_EXPIRED";
  case AuthResult::SESSION_REVOKED:
    return "SESSION_REVOKED";
  case AuthResult::INVALID_RESET_TOKEN:
    return "INVALID_RESET_TOKEN";
  case AuthResult::USER_NOT_FOUND:
    return "USER_NOT_FOUND";
  case AuthResult::UNAVAILABLE:
    return "UNAVAILABLE";
  }
  return "UNKNOWN";
}

std::string DefaultMessage(AuthResult result) {
  switch (result) {
  case AuthResult::SUCCESS:
    return "OK";
  case AuthResult::INVALID_INPUT:
    return "Please check the highlighted fields and try again.";
  case AuthResult::WEAK_PASSWORD:
    return "Password does not meet the security requirements.";
  case AuthResult::USERNAME_TAKEN:
    return "That username is already taken.";
  case AuthResult::EMAIL_TAKEN:
    return "That email address is already registered.";
  case AuthResult::INVALID_CREDENTIALS:
    return "Invalid username/email or password.";
  case AuthResult::ACCOUNT_LOCKED:
    return "Too many failed attempts. Please wait before trying again.";
  case AuthResult::SESSION_NOT_FOUND:
    return "Session not found. Please sign in.";
  case AuthResult::SESSION_EXPIRED:
    return "Your session has expired. Please sign in again.";
  case AuthResult::SESSION_REVOKED:
    return "Your session has ended. Please sign in again.";
  case AuthResult::INVALID_RESET_TOKEN:
    return "This reset link is invalid or has expired.";
  case AuthResult::USER_NOT_FOUND:
    return "No matching account was found.";
  case AuthResult::UNAVAILABLE:
    return "The account service is temporarily unavailable. Please try again.";
  }
  return "Unknown error.";
}

bool IsRetryable(AuthResult result) {
  return result == AuthResult::UNAVAILABLE;
}

} // namespace Auth
