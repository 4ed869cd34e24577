#include "../include/Database/AuthSchema.h"

namespace Database {

const std::vector<Migration>& authSchemaMigrations() {
  static const std::vector<Migration> migrations = {
      Migration(1, "Create identity and session tables", R"(
        CREATE TABLE IF NOT EXISTS users (
            user_id TEXT PRIMARY KEY,
            username TEXT NOT NULL UNIQUE COLLATE NOCASE,
            email TEXT NOT NULL UNIQUE COLLATE NOCASE,
            password_hash TEXT NOT NULL,
            salt BLOB NOT NULL,
            iterations INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            last_login INTEGER,
            profile_fields TEXT NOT NULL DEFAULT '{}',
            disabled INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS sessions (
            token TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES users(user_id),
            issued_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            revoked INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_sessions_user ON sessions(user_id);
        CREATE INDEX IF NOT EXISTS idx_sessions_expires ON sessions(expires_at);

        CREATE TABLE IF NOT EXISTS login_attempts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            identifier TEXT NOT NULL COLLATE NOCASE,
            timestamp INTEGER NOT NULL,
            outcome TEXT NOT NULL CHECK (outcome IN
                ('success', 'bad_credentials', 'unknown_identifier', 'locked', 'disabled')),
            user_id TEXT REFERENCES users(user_id)
        );
        CREATE INDEX IF NOT EXISTS idx_login_attempts_identifier
            ON login_attempts(identifier, timestamp);

        CREATE TABLE IF NOT EXISTS password_resets (
            token TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES users(user_id),
            expires_at INTEGER NOT NULL,
            used INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_password_resets_user ON password_resets(user_id);
      )"),
  };
  return migrations;
}

DatabaseResult openAuthDatabase(DatabaseManager& db, const std::string& dbPath,
                                const std::string& encryptionKey) {
  auto result = db.initialize(dbPath, encryptionKey);
  if (!result) {
    return result;
  }

  result = db.runMigrations(authSchemaMigrations());
  if (!result) {
    db.close();
    return result;
  }

  return DatabaseResult(true, "Identity store ready at schema version " +
                                  std::to_string(db.getSchemaVersion()));
}

} // namespace Database
