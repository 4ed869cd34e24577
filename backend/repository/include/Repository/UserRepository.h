#pragma once

#include "Database/DatabaseManager.h"
#include "Logger.h"
#include "RepositoryTypes.h"
#include <map>
#include <string>
#include <vector>

// Forward declaration
struct sqlite3_stmt;

namespace Repository {

/**
 * @brief Durable store of registered accounts (the users table)
 *
 * Provides:
 * - Account creation with username and email uniqueness enforced by the
 *   table's case-insensitive UNIQUE constraints
 * - Lookup by username or email
 * - Password rotation, profile edits and soft-disable
 *
 * The repository only stores digests it is given; hashing lives in
 * Auth::PasswordHasher.
 */
class UserRepository {
  public:
    // createUser() error messages for the two uniqueness violations
    static constexpr const char* DUPLICATE_USERNAME = "Username is already taken";
    static constexpr const char* DUPLICATE_EMAIL = "Email is already registered";

    /**
     * @brief Constructor
     * @param dbManager Reference to an initialized database manager
     * @param clock Time source used for created_at and last_login
     */
    explicit UserRepository(Database::DatabaseManager& dbManager, Clock clock = SystemClock());

    /**
     * @brief Insert a new account
     * @param username Unique username (case-insensitive)
     * @param email Unique email (case-insensitive)
     * @param passwordHash Base64 digest produced by the password hasher
     * @param salt Per-user salt
     * @param iterations PBKDF2 iteration count used for the digest
     * @return The created user, or 409 with DUPLICATE_USERNAME or
     *         DUPLICATE_EMAIL when a uniqueness constraint fails
     */
    Result<User> createUser(const std::string& username, const std::string& email,
                            const std::string& passwordHash, const std::vector<uint8_t>& salt,
                            int iterations);

    /**
     * @brief Find a user by username or email, ignoring case
     * @param identifier Username or email as typed
     * @return The user including password material, or 404
     */
    Result<User> findByIdentifier(const std::string& identifier);

    /**
     * @brief Get user by ID
     * @param userId User ID to search for
     * @return The user including password material, or 404
     */
    Result<User> getUserById(const std::string& userId);

    /**
     * @brief Replace a user's digest, salt and iteration count
     * @return true, or 404 if the user does not exist
     */
    Result<bool> updatePassword(const std::string& userId, const std::string& passwordHash,
                                const std::vector<uint8_t>& salt, int iterations);

    /**
     * @brief Replace a user's email address
     * @return true, 404 if the user does not exist, or 409 with
     *         DUPLICATE_EMAIL when another account already uses the address
     */
    Result<bool> updateEmail(const std::string& userId, const std::string& email);

    /**
     * @brief Merge fields into the user's profile; an empty value removes the key
     * @return The merged profile, 404 if the user does not exist, or 400 if a
     *         key or value is not valid UTF-8
     */
    Result<std::map<std::string, std::string>> updateProfile(
        const std::string& userId, const std::map<std::string, std::string>& fields);

    /**
     * @brief Update user's last login timestamp to the current clock time
     */
    Result<bool> updateLastLogin(const std::string& userId);

    /**
     * @brief Soft-disable an account; the row is kept
     */
    Result<bool> disableUser(const std::string& userId);

    /**
     * @brief List accounts without password material
     * @param params Pagination parameters; sortField is one of
     *        created_at, username, email
     */
    Result<PaginatedResult<User>> listUsers(const PaginationParams& params = PaginationParams());

  private:
    /**
     * @brief Convert database row to User object
     * @param stmt Statement positioned on a row selected with USER_COLUMNS
     */
    User mapRowToUser(sqlite3_stmt* stmt);

    Result<User> fetchSingleUser(const std::string& sql, const std::string& key);

    Result<bool> updateSingleUser(const std::string& sql, const std::string& userId,
                                  const std::string& operation);

    static std::map<std::string, std::string> parseProfile(const std::string& text);
    static std::string serializeProfile(const std::map<std::string, std::string>& fields);

  private:
    Database::DatabaseManager& m_dbManager;
    Clock m_clock;
    static constexpr const char* COMPONENT_NAME = "UserRepository";
    static constexpr size_t USER_ID_BYTES = 16;
    static constexpr int MAX_PAGE_SIZE = 500;
};

}  // namespace Repository
