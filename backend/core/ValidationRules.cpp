#include "ValidationRules.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>

namespace Auth {

namespace {

template <typename Pred> bool AnyChar(const std::string &value, Pred pred) {
  return std::any_of(value.begin(), value.end(), [&](char c) {
    return pred(static_cast<unsigned char>(c)) != 0;
  });
}

constexpr size_t MIN_USERNAME_LENGTH = 3;
constexpr size_t MAX_USERNAME_LENGTH = 20;
constexpr size_t MAX_EMAIL_LENGTH = 254;
constexpr size_t MIN_PASSWORD_LENGTH = 8;
constexpr size_t MAX_PASSWORD_LENGTH = 256;

} // namespace

const std::vector<ValidationRule> &UsernameRules() {
  static const std::vector<ValidationRule> rules = {
      {"username_length", AuthResult::INVALID_INPUT,
       [](const std::string &v) {
         return v.size() >= MIN_USERNAME_LENGTH &&
                v.size() <= MAX_USERNAME_LENGTH;
       },
       "Username must be 3 to 20 characters long"},
      {"username_charset", AuthResult::INVALID_INPUT,
       [](const std::string &v) {
         return std::all_of(v.begin(), v.end(), [](char c) {
           return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
         });
       },
       "Username can only contain letters, numbers and underscores"},
  };
  return rules;
}

const std::vector<ValidationRule> &EmailRules() {
  static const std::vector<ValidationRule> rules = {
      {"email_format", AuthResult::INVALID_INPUT,
       [](const std::string &v) {
         static const std::regex pattern(
             R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
         return v.size() <= MAX_EMAIL_LENGTH && std::regex_match(v, pattern);
       },
       "Email must look like name@example.com"},
  };
  return rules;
}

const std::vector<ValidationRule> &PasswordRules() {
  static const std::vector<ValidationRule> rules = {
      {"password_min_length", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) { return v.size() >= MIN_PASSWORD_LENGTH; },
       "Password must be at least 8 characters"},
      {"password_max_length", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) { return v.size() <= MAX_PASSWORD_LENGTH; },
       "Password must be at most 256 characters"},
      {"password_uppercase", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) {
         return AnyChar(v, [](unsigned char c) { return std::isupper(c); });
       },
       "Password must contain at least one uppercase letter"},
      {"password_lowercase", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) {
         return AnyChar(v, [](unsigned char c) { return std::islower(c); });
       },
       "Password must contain at least one lowercase letter"},
      {"password_digit", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) {
         return AnyChar(v, [](unsigned char c) { return std::isdigit(c); });
       },
       "Password must contain at least one digit"},
      {"password_symbol", AuthResult::WEAK_PASSWORD,
       [](const std::string &v) {
         return AnyChar(v, [](unsigned char c) { return std::ispunct(c); });
       },
       "Password must contain at least one special character"},
  };
  return rules;
}

bool IsValidUtf8(const std::string &value) {
  size_t i = 0;
  while (i < value.size()) {
    const unsigned char lead = static_cast<unsigned char>(value[i]);
    size_t length = 0;
    uint32_t codePoint = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      codePoint = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > value.size()) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      const unsigned char next = static_cast<unsigned char>(value[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (next & 0x3F);
    }
    static const uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codePoint < minimum[length] || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

ValidationReport Evaluate(const std::vector<ValidationRule> &rules,
                          const std::string &value) {
  ValidationReport report;
  for (const auto &rule : rules) {
    if (rule.predicate(value)) {
      continue;
    }
    if (report.violatedRules.empty()) {
      report.code = rule.code;
    }
    report.violatedRules.push_back(rule.name);
    report.messages.push_back(rule.message);
  }
  return report;
}

} // namespace Auth
