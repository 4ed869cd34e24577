#pragma once
#include "Auth.h"

#include <functional>
#include <string>
#include <vector>

namespace Auth {

// One declarative input check. predicate returns true when the value passes.
struct ValidationRule {
  std::string name;
  AuthResult code;
  std::function<bool(const std::string &)> predicate;
  std::string message;
};

struct ValidationReport {
  AuthResult code = AuthResult::SUCCESS;
  std::vector<std::string> violatedRules;
  std::vector<std::string> messages;

  bool ok() const { return violatedRules.empty(); }
};

// 3-20 characters of [A-Za-z0-9_]
const std::vector<ValidationRule> &UsernameRules();

// local@domain.tld
const std::vector<ValidationRule> &EmailRules();

// 8-256 characters with upper, lower, digit and symbol
const std::vector<ValidationRule> &PasswordRules();

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool IsValidUtf8(const std::string &value);

// Runs every rule (no short-circuit). code is the first violated rule's code.
ValidationReport Evaluate(const std::vector<ValidationRule> &rules,
                          const std::string &value);

} // namespace Auth
