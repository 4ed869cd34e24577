// MonumentAuthCli.cpp : command-line front end for the identity store.
//
// Usage: monument_auth_cli [--config FILE] [--verbose] <command> [args...]
// A password argument of "-" is read from standard input instead.

#include "AuthConfig.h"
#include "AuthService.h"
#include "Database/AuthSchema.h"
#include "Database/DatabaseManager.h"
#include "Repository/Logger.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
  std::cerr
      << "Usage: monument_auth_cli [--config FILE] [--verbose] <command>\n"
         "Commands:\n"
         "  register <username> <email> <password>\n"
         "  login <username|email> <password>\n"
         "  validate <token>\n"
         "  logout <token>\n"
         "  logout-all <token>\n"
         "  email <token> <new_email>\n"
         "  passwd <user_id> <old_password> <new_password>\n"
         "  reset-request <username|email>\n"
         "  reset <reset_token> <new_password>\n"
         "  disable <user_id>\n"
         "  attempts <username|email> [limit]\n"
         "  sweep\n"
         "  users [offset] [limit]\n";
}

std::string FormatTime(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmInfo = {};
  gmtime_r(&t, &tmInfo);
  std::ostringstream oss;
  oss << std::put_time(&tmInfo, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string ReadSecret(const std::string &arg) {
  if (arg != "-") {
    return arg;
  }
  std::string line;
  std::getline(std::cin, line);
  return line;
}

template <typename T> int Report(const Auth::AuthResponse<T> &response) {
  if (response.success()) {
    return 0;
  }
  std::cerr << Auth::AuthResultToString(response.result) << ": "
            << response.message << "\n";
  for (const auto &rule : response.violations) {
    std::cerr << "  - " << rule << "\n";
  }
  return Auth::IsRetryable(response.result) ? 75 : 1;
}

int RunCommand(Auth::AuthService &service, const std::vector<std::string> &args) {
  const std::string &command = args[0];
  auto need = [&](size_t count) {
    if (args.size() < count + 1) {
      PrintUsage();
      return false;
    }
    return true;
  };

  if (command == "register") {
    if (!need(3))
      return 2;
    auto response = service.registerUser(args[1], args[2], ReadSecret(args[3]));
    if (response.success()) {
      std::cout << "user_id " << response.data.userId << "\n";
    }
    return Report(response);
  }

  if (command == "login") {
    if (!need(2))
      return 2;
    auto response = service.login(args[1], ReadSecret(args[2]));
    if (response.success()) {
      std::cout << "token " << response.data.token << "\n"
                << "expires " << FormatTime(response.data.expiresAt) << "\n";
    }
    return Report(response);
  }

  if (command == "validate") {
    if (!need(1))
      return 2;
    auto response = service.validateSession(args[1]);
    if (response.success()) {
      std::cout << "user_id " << response.data.userId << "\n"
                << "username " << response.data.username << "\n"
                << "expires " << FormatTime(response.data.sessionExpiresAt)
                << "\n";
    }
    return Report(response);
  }

  if (command == "logout") {
    if (!need(1))
      return 2;
    return Report(service.logout(args[1]));
  }

  if (command == "logout-all") {
    if (!need(1))
      return 2;
    auto response = service.logoutAll(args[1]);
    if (response.success()) {
      std::cout << "revoked " << response.data << "\n";
    }
    return Report(response);
  }

  if (command == "email") {
    if (!need(2))
      return 2;
    auto response = service.changeEmail(args[1], args[2]);
    if (response.success()) {
      std::cout << "email " << response.data.email << "\n";
    }
    return Report(response);
  }

  if (command == "passwd") {
    if (!need(3))
      return 2;
    return Report(service.changePassword(args[1], ReadSecret(args[2]),
                                         ReadSecret(args[3])));
  }

  if (command == "reset-request") {
    if (!need(1))
      return 2;
    auto response = service.requestPasswordReset(args[1]);
    if (response.success()) {
      std::cout << "reset_token " << response.data << "\n";
    }
    return Report(response);
  }

  if (command == "reset") {
    if (!need(2))
      return 2;
    return Report(service.resetPassword(args[1], ReadSecret(args[2])));
  }

  if (command == "disable") {
    if (!need(1))
      return 2;
    return Report(service.disableUser(args[1]));
  }

  if (command == "attempts") {
    if (!need(1))
      return 2;
    int limit = args.size() > 2 ? std::stoi(args[2]) : 20;
    auto response = service.recentLoginAttempts(args[1], limit);
    if (response.success()) {
      for (const auto &attempt : response.data) {
        std::cout << FormatTime(attempt.timestamp) << "  "
                  << Repository::loginOutcomeToString(attempt.outcome) << "  "
                  << attempt.identifier << "\n";
      }
    }
    return Report(response);
  }

  if (command == "sweep") {
    auto response = service.sweepExpiredSessions();
    if (response.success()) {
      std::cout << "swept " << response.data << "\n";
    }
    return Report(response);
  }

  if (command == "users") {
    Repository::PaginationParams params;
    if (args.size() > 1)
      params.offset = std::stoi(args[1]);
    if (args.size() > 2)
      params.limit = std::stoi(args[2]);
    auto response = service.listUsers(params);
    if (response.success()) {
      for (const auto &user : response.data.items) {
        std::cout << user.userId << "  " << user.username << "  "
                  << user.email << (user.disabled ? "  (disabled)" : "")
                  << "\n";
      }
      std::cout << response.data.items.size() << " of "
                << response.data.totalCount << " users\n";
    }
    return Report(response);
  }

  PrintUsage();
  return 2;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath;
  bool verbose = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    PrintUsage();
    return 2;
  }

  auto config = Auth::LoadAuthConfig(configPath);
  if (!config) {
    std::cerr << "Configuration error: " << config.error() << "\n";
    return 2;
  }

  auto &logger = Repository::Logger::getInstance();
  if (!logger.initialize(config->logFilePath,
                         verbose ? Repository::LogLevel::DEBUG
                                 : Repository::LogLevel::INFO,
                         verbose)) {
    std::cerr << "Warning: logging to " << config->logFilePath
              << " is unavailable\n";
  }

  int exitCode = 0;
  {
    Database::DatabaseManager db;
    auto opened = Database::openAuthDatabase(db, config->databasePath,
                                             config->encryptionKey);
    if (!opened) {
      std::cerr << "Cannot open identity store: " << opened.message << "\n";
      logger.shutdown();
      return 75;
    }

    try {
      Auth::AuthService service(db, *config);
      exitCode = RunCommand(service, args);
    } catch (const std::exception &e) {
      // std::stoi on a bad number, or the CSPRNG failing at start-up
      std::cerr << "Error: " << e.what() << "\n";
      exitCode = 1;
    }
  }

  logger.shutdown();
  return exitCode;
}
