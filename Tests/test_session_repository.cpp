/**
 * @file test_session_repository.cpp
 * @brief Unit tests for SessionRepository
 *
 * Tests session issue, validation around the expiry boundary, revocation,
 * sliding refresh with its absolute cap, and the expired-session sweep.
 */

#include "Repository/SessionRepository.h"
#include "TestUtils.h"

#include <set>

constexpr const char* TEST_DB_PATH = "test_session_repo.db";

using std::chrono::hours;
using std::chrono::seconds;

// ============================================================================
// Test Cases
// ============================================================================

static bool testIssueSession(Repository::SessionRepository& sessionRepo,
                             Repository::UserRepository& userRepo,
                             TestUtils::FakeClock& clock) {
    TEST_START("Issue Session");

    std::string userId = TestUtils::createTestUser(userRepo, "session_alice");
    TEST_ASSERT(!userId.empty(), "User creation should succeed");

    auto session = sessionRepo.issue(userId, hours(1));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");
    TEST_ASSERT(session->token.size() >= 43, "Token should carry 256 bits");
    TEST_ASSERT(session->userId == userId, "Owner should match");
    TEST_ASSERT(session->issuedAt == clock.now(), "issued_at should come from the clock");
    TEST_ASSERT(session->expiresAt == clock.now() + hours(1), "expires_at should be issued_at + ttl");
    TEST_ASSERT(!session->revoked, "New session should not be revoked");

    auto stored = sessionRepo.getSession(session->token);
    TEST_ASSERT(stored.hasValue(), "Session should be stored");
    TEST_ASSERT(stored->expiresAt == session->expiresAt, "Stored expiry should match");

    TEST_PASS();
}

static bool testIssueRejectsBadInput(Repository::SessionRepository& sessionRepo) {
    TEST_START("Issue Session - Bad Input");

    auto noTtl = sessionRepo.issue("someone", seconds(0));
    TEST_ASSERT(!noTtl.hasValue(), "Zero ttl should be rejected");
    TEST_ASSERT(noTtl.errorCode == 400, "Error code should be 400");

    auto noOwner = sessionRepo.issue("no-such-user", hours(1));
    TEST_ASSERT(!noOwner.hasValue(), "Unknown owner should be rejected");
    TEST_ASSERT(noOwner.errorCode == 404, "Error code should be 404");

    TEST_PASS();
}

static bool testTokensAreUnique(Repository::SessionRepository& sessionRepo,
                                Repository::UserRepository& userRepo) {
    TEST_START("Issue Session - Tokens Are Unique");

    std::string userId = TestUtils::createTestUser(userRepo, "session_many");
    TEST_ASSERT(!userId.empty(), "User creation should succeed");

    std::set<std::string> tokens;
    for (int i = 0; i < 20; ++i) {
        auto session = sessionRepo.issue(userId, hours(1));
        TEST_ASSERT(session.hasValue(), "Issue should succeed");
        tokens.insert(session->token);
    }
    TEST_ASSERT(tokens.size() == 20, "Every session should get its own token");

    auto active = sessionRepo.getActiveSessions(userId);
    TEST_ASSERT(active.hasValue() && active->size() == 20, "All sessions should be active");

    TEST_PASS();
}

static bool testExpiryBoundary(Repository::SessionRepository& sessionRepo,
                               Repository::UserRepository& userRepo,
                               TestUtils::FakeClock& clock) {
    TEST_START("Validate - Expiry Boundary");

    std::string userId = TestUtils::createTestUser(userRepo, "session_bob");
    auto session = sessionRepo.issue(userId, seconds(600));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");

    TEST_STEP("One second before expiry");
    clock.advance(seconds(599));
    auto before = sessionRepo.validate(session->token);
    TEST_ASSERT(before.hasValue(), "Session should be valid just before expiry");
    TEST_ASSERT(before->userId == userId, "Context should name the owner");
    TEST_ASSERT(before->username == "session_bob", "Context should carry the username");

    TEST_STEP("Exactly at expiry");
    clock.advance(seconds(1));
    auto at = sessionRepo.validate(session->token);
    TEST_ASSERT(!at.hasValue(), "Session should be expired at expires_at");
    TEST_ASSERT(at.errorCode == 410, "Error code should be 410");

    clock.advance(seconds(1));
    TEST_ASSERT(sessionRepo.validate(session->token).errorCode == 410, "Still expired afterwards");

    TEST_PASS();
}

static bool testUnknownToken(Repository::SessionRepository& sessionRepo) {
    TEST_START("Validate - Unknown Token");

    TEST_ASSERT(sessionRepo.validate("not-a-real-token").errorCode == 404, "Unknown token should be 404");
    TEST_ASSERT(sessionRepo.validate("").errorCode == 404, "Empty token should be 404");

    TEST_PASS();
}

static bool testRevoke(Repository::SessionRepository& sessionRepo,
                       Repository::UserRepository& userRepo,
                       TestUtils::FakeClock& clock) {
    TEST_START("Revoke - Revocation Wins Over Expiry");

    std::string userId = TestUtils::createTestUser(userRepo, "session_carol");
    auto session = sessionRepo.issue(userId, seconds(60));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");

    TEST_ASSERT(sessionRepo.revoke(session->token).hasValue(), "Revoke should succeed");
    TEST_ASSERT(sessionRepo.validate(session->token).errorCode == 403, "Revoked session should be 403");

    clock.advance(seconds(120));
    TEST_ASSERT(sessionRepo.validate(session->token).errorCode == 403,
                "A revoked session reports revoked even after it expires");

    TEST_ASSERT(sessionRepo.revoke("not-a-real-token").errorCode == 404, "Unknown token should be 404");

    TEST_PASS();
}

static bool testRevokeAllForUser(Repository::SessionRepository& sessionRepo,
                                 Repository::UserRepository& userRepo) {
    TEST_START("Revoke All For User");

    std::string daveId = TestUtils::createTestUser(userRepo, "session_dave");
    std::string erinId = TestUtils::createTestUser(userRepo, "session_erin");

    auto d1 = sessionRepo.issue(daveId, hours(1));
    auto d2 = sessionRepo.issue(daveId, hours(1));
    auto e1 = sessionRepo.issue(erinId, hours(1));
    TEST_ASSERT(d1.hasValue() && d2.hasValue() && e1.hasValue(), "Issue should succeed");

    auto revoked = sessionRepo.revokeAllForUser(daveId);
    TEST_ASSERT(revoked.hasValue(), "Bulk revoke should succeed");
    TEST_ASSERT(*revoked == 2, "Both of dave's sessions should be revoked");

    TEST_ASSERT(sessionRepo.validate(d1->token).errorCode == 403, "First session revoked");
    TEST_ASSERT(sessionRepo.validate(d2->token).errorCode == 403, "Second session revoked");
    TEST_ASSERT(sessionRepo.validate(e1->token).hasValue(), "Other users are unaffected");

    auto again = sessionRepo.revokeAllForUser(daveId);
    TEST_ASSERT(again.hasValue() && *again == 0, "Nothing left to revoke");

    TEST_PASS();
}

static bool testDisabledOwnerIsRevoked(Repository::SessionRepository& sessionRepo,
                                       Repository::UserRepository& userRepo) {
    TEST_START("Validate - Disabled Owner");

    std::string userId = TestUtils::createTestUser(userRepo, "session_frank");
    auto session = sessionRepo.issue(userId, hours(1));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");

    TEST_ASSERT(userRepo.disableUser(userId).hasValue(), "Disable should succeed");
    TEST_ASSERT(sessionRepo.validate(session->token).errorCode == 403,
                "Sessions of a disabled user should read as revoked");

    TEST_PASS();
}

static bool testSlidingExtendWithCap(Repository::SessionRepository& sessionRepo,
                                     Repository::UserRepository& userRepo,
                                     TestUtils::FakeClock& clock) {
    TEST_START("Extend - Sliding Refresh Capped at Max Lifetime");

    const seconds ttl(100);
    const seconds maxLifetime(250);

    std::string userId = TestUtils::createTestUser(userRepo, "session_grace");
    auto session = sessionRepo.issue(userId, ttl);
    TEST_ASSERT(session.hasValue(), "Issue should succeed");
    const auto issuedAt = session->issuedAt;

    clock.advance(seconds(50));
    auto first = sessionRepo.extend(session->token, ttl, maxLifetime);
    TEST_ASSERT(first.hasValue(), "Extend should succeed");
    TEST_ASSERT(first->expiresAt == clock.now() + ttl, "Expiry should slide to now + ttl");

    clock.advance(seconds(90));
    auto second = sessionRepo.extend(session->token, ttl, maxLifetime);
    TEST_ASSERT(second.hasValue(), "Second extend should succeed");
    TEST_ASSERT(second->expiresAt == clock.now() + ttl, "Expiry should slide again");

    clock.advance(seconds(90));
    auto capped = sessionRepo.extend(session->token, ttl, maxLifetime);
    TEST_ASSERT(capped.hasValue(), "Third extend should succeed");
    TEST_ASSERT(capped->expiresAt == issuedAt + maxLifetime, "Expiry should stop at the cap");

    auto stored = sessionRepo.getSession(session->token);
    TEST_ASSERT(stored->expiresAt == issuedAt + maxLifetime, "Stored expiry should be the cap");

    clock.advance(seconds(20));
    TEST_ASSERT(!sessionRepo.validate(session->token).hasValue(), "Capped session should expire");

    TEST_PASS();
}

static bool testExtendNeverShortens(Repository::SessionRepository& sessionRepo,
                                    Repository::UserRepository& userRepo) {
    TEST_START("Extend - Never Moves Expiry Backwards");

    std::string userId = TestUtils::createTestUser(userRepo, "session_heidi");
    auto session = sessionRepo.issue(userId, hours(10));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");

    auto shorter = sessionRepo.extend(session->token, hours(1), hours(24));
    TEST_ASSERT(shorter.hasValue(), "Extend should succeed");
    TEST_ASSERT(shorter->expiresAt == session->expiresAt, "A shorter ttl must not shorten the session");

    TEST_PASS();
}

static bool testExtendRejectsDeadSessions(Repository::SessionRepository& sessionRepo,
                                          Repository::UserRepository& userRepo,
                                          TestUtils::FakeClock& clock) {
    TEST_START("Extend - Revoked and Expired Sessions");

    std::string userId = TestUtils::createTestUser(userRepo, "session_ivan");
    auto revoked = sessionRepo.issue(userId, seconds(60));
    auto expiring = sessionRepo.issue(userId, seconds(60));
    TEST_ASSERT(revoked.hasValue() && expiring.hasValue(), "Issue should succeed");

    TEST_ASSERT(sessionRepo.revoke(revoked->token).hasValue(), "Revoke should succeed");
    TEST_ASSERT(sessionRepo.extend(revoked->token, seconds(60), hours(1)).errorCode == 403,
                "Revoked session cannot be extended");

    clock.advance(seconds(60));
    TEST_ASSERT(sessionRepo.extend(expiring->token, seconds(60), hours(1)).errorCode == 410,
                "Expired session cannot be revived");

    TEST_ASSERT(sessionRepo.extend("not-a-real-token", seconds(60), hours(1)).errorCode == 404,
                "Unknown token should be 404");

    TEST_PASS();
}

static bool testSweepExpired(Repository::SessionRepository& sessionRepo,
                             Repository::UserRepository& userRepo,
                             TestUtils::FakeClock& clock) {
    TEST_START("Sweep Expired - Deletes Only Expired Rows");

    // Clear out sessions left behind by earlier cases
    clock.advance(hours(24 * 365));
    auto preSweep = sessionRepo.sweepExpired();
    TEST_ASSERT(preSweep.hasValue(), "Initial sweep should succeed");

    std::string userId = TestUtils::createTestUser(userRepo, "session_judy");

    TEST_STEP("Issuing 600 short sessions to cross a batch boundary");
    for (int i = 0; i < 600; ++i) {
        auto s = sessionRepo.issue(userId, seconds(10));
        TEST_ASSERT(s.hasValue(), "Issue should succeed");
    }
    auto survivor = sessionRepo.issue(userId, hours(1));
    TEST_ASSERT(survivor.hasValue(), "Issue should succeed");

    clock.advance(seconds(10));
    auto swept = sessionRepo.sweepExpired();
    TEST_ASSERT(swept.hasValue(), "Sweep should succeed");
    TEST_ASSERT(*swept == 600, "Every expired session should be deleted");

    TEST_ASSERT(sessionRepo.validate(survivor->token).hasValue(), "Live session should survive the sweep");

    auto idle = sessionRepo.sweepExpired();
    TEST_ASSERT(idle.hasValue() && *idle == 0, "A second sweep finds nothing");

    TEST_PASS();
}

static bool testTokensNotLogged(Repository::SessionRepository& sessionRepo,
                                Repository::UserRepository& userRepo) {
    TEST_START("Logging - Tokens Appear Only as a Prefix");

    std::string userId = TestUtils::createTestUser(userRepo, "session_kim");
    auto session = sessionRepo.issue(userId, hours(1));
    TEST_ASSERT(session.hasValue(), "Issue should succeed");
    TEST_ASSERT(sessionRepo.revoke(session->token).hasValue(), "Revoke should succeed");

    auto& logger = Repository::Logger::getInstance();
    logger.flush();
    auto entries = logger.getRecentEntries("SessionRepository", 20);
    TEST_ASSERT(!entries.empty(), "Session events should be logged");
    for (const auto& entry : entries) {
        TEST_ASSERT(entry.details.find(session->token) == std::string::npos,
                    "Full token leaked in: " << entry.message);
    }

    TEST_PASS();
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    TestUtils::printTestHeader("SessionRepository Unit Tests");

    Database::DatabaseManager dbManager;
    TestUtils::initializeTestLogger("test_session_repo.log");

    if (!TestUtils::initializeTestDatabase(dbManager, TEST_DB_PATH)) {
        std::cerr << COLOR_RED << "Failed to initialize test environment" << COLOR_RESET << std::endl;
        return 1;
    }

    TestUtils::FakeClock clock;
    Repository::UserRepository userRepo(dbManager, clock.clock());
    Repository::SessionRepository sessionRepo(dbManager, clock.clock());

    testIssueSession(sessionRepo, userRepo, clock);
    testIssueRejectsBadInput(sessionRepo);
    testTokensAreUnique(sessionRepo, userRepo);
    testExpiryBoundary(sessionRepo, userRepo, clock);
    testUnknownToken(sessionRepo);
    testRevoke(sessionRepo, userRepo, clock);
    testRevokeAllForUser(sessionRepo, userRepo);
    testDisabledOwnerIsRevoked(sessionRepo, userRepo);

    std::cout << "\n" << COLOR_CYAN << "Running Sliding Expiration Tests..." << COLOR_RESET << std::endl;
    testSlidingExtendWithCap(sessionRepo, userRepo, clock);
    testExtendNeverShortens(sessionRepo, userRepo);
    testExtendRejectsDeadSessions(sessionRepo, userRepo, clock);

    std::cout << "\n" << COLOR_CYAN << "Running Sweep Tests..." << COLOR_RESET << std::endl;
    testSweepExpired(sessionRepo, userRepo, clock);
    testTokensNotLogged(sessionRepo, userRepo);

    TestUtils::shutdownTestEnvironment(dbManager, TEST_DB_PATH);
    TestUtils::printTestSummary("SessionRepository Test");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
