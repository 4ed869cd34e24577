#include "Repository/RepositoryTypes.h"

namespace Repository {

std::string loginOutcomeToString(LoginOutcome outcome) {
    switch (outcome) {
        case LoginOutcome::SUCCESS:
            return "success";
        case LoginOutcome::BAD_CREDENTIALS:
            return "bad_credentials";
        case LoginOutcome::UNKNOWN_IDENTIFIER:
            return "unknown_identifier";
        case LoginOutcome::LOCKED:
            return "locked";
        case LoginOutcome::DISABLED:
            return "disabled";
    }
    return "bad_credentials";
}

std::optional<LoginOutcome> loginOutcomeFromString(const std::string& value) {
    if (value == "success") return LoginOutcome::SUCCESS;
    if (value == "bad_credentials") return LoginOutcome::BAD_CREDENTIALS;
    if (value == "unknown_identifier") return LoginOutcome::UNKNOWN_IDENTIFIER;
    if (value == "locked") return LoginOutcome::LOCKED;
    if (value == "disabled") return LoginOutcome::DISABLED;
    return std::nullopt;
}

} // namespace Repository
