#ifndef DOCREDACT_AUDIT_AUDIT_STORE_HPP
#define DOCREDACT_AUDIT_AUDIT_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>
#include <zlib.h>
#include "util/logger.hpp"

namespace docredact {
namespace audit {

// One completed redaction as recorded in the audit database.
struct AuditRecord {
    std::string originalPath;
    std::string redactedPath;
    std::string originalSha256;
    std::string redactedSha256;
    std::string format;
    size_t redactionCount = 0;
    // Text extracted from the verified output. It no longer contains any
    // accepted literal.
    std::string redactedText;
};

class AuditStore {
  public:
    // -------------------------------------------------------------------------
    // Constructor accepting the path of the .sqlite audit database. The file
    // is created on first use.
    // -------------------------------------------------------------------------
    explicit AuditStore(const std::string& dbFilePath) : m_dbFilePath(dbFilePath) {}

    // -------------------------------------------------------------------------
    // Inserts one record. Returns the new row id, or -1 on failure.
    // -------------------------------------------------------------------------
    int64_t Record(const AuditRecord& record) {
        using namespace docredact::util::logger;
        Logger& logger = Logger::getInstance();

        sqlite3* db = nullptr;
        if (!openDatabase(db)) {
            logger.error("[AuditStore] Could not open database: " + m_dbFilePath);
            sqlite3_close(db);
            return -1;
        }
        if (!initDatabaseSchema(db)) {
            logger.error("[AuditStore] Failed to initialize database schema.");
            sqlite3_close(db);
            return -1;
        }

        // redacted text -> BLOB (compressed)
        std::vector<uint8_t> compressed;
        uLongf outSize = compressBound(record.redactedText.size());
        compressed.resize(outSize);
        if (compress2(compressed.data(), &outSize,
                      reinterpret_cast<const Bytef*>(record.redactedText.data()), record.redactedText.size(),
                      Z_BEST_COMPRESSION) != Z_OK) {
            logger.error("[AuditStore] compress2 failed.");
            sqlite3_close(db);
            return -1;
        }
        compressed.resize(outSize);

        const char* sql = "INSERT INTO redactions (original_path, redacted_path, original_sha256,"
                          " redacted_sha256, format, redaction_count, text_size, redacted_text)"
                          " VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK || !stmt) {
            logger.error("[AuditStore] prepare failed: " + std::string(sqlite3_errmsg(db)));
            sqlite3_close(db);
            return -1;
        }

        sqlite3_bind_text(stmt, 1, record.originalPath.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, record.redactedPath.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, record.originalSha256.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, record.redactedSha256.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, record.format.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(record.redactionCount));
        sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(record.redactedText.size()));
        sqlite3_bind_blob(stmt, 8, compressed.data(), static_cast<int>(compressed.size()), SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            logger.error("[AuditStore] insert failed: " + std::string(sqlite3_errmsg(db)));
            sqlite3_close(db);
            return -1;
        }

        const int64_t id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
        sqlite3_close(db);
        logger.info("[AuditStore] Recorded redaction #" + std::to_string(id) + " (" +
                    std::to_string(record.redactionCount) + " item(s)).");
        return id;
    }

    // -------------------------------------------------------------------------
    // Number of rows in the redactions table; 0 when the database is missing
    // or unreadable.
    // -------------------------------------------------------------------------
    int64_t CountRecords() {
        sqlite3* db = nullptr;
        if (!openDatabase(db) || !initDatabaseSchema(db)) {
            sqlite3_close(db);
            return 0;
        }
        int64_t count = 0;
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM redactions;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW)
                count = static_cast<int64_t>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return count;
    }

    // -------------------------------------------------------------------------
    // Loads and inflates the stored text of record `id`. Returns false if the
    // record does not exist or cannot be decompressed.
    // -------------------------------------------------------------------------
    bool LoadRedactedText(int64_t id, std::string& out) {
        using namespace docredact::util::logger;
        sqlite3* db = nullptr;
        if (!openDatabase(db) || !initDatabaseSchema(db)) {
            sqlite3_close(db);
            return false;
        }

        const char* sql = "SELECT text_size, redacted_text FROM redactions WHERE id = ?;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            sqlite3_close(db);
            return false;
        }
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const uLongf expected = static_cast<uLongf>(sqlite3_column_int64(stmt, 0));
            const void* blob = sqlite3_column_blob(stmt, 1);
            const int blobSize = sqlite3_column_bytes(stmt, 1);
            std::vector<uint8_t> inflated(expected);
            uLongf inflatedSize = expected;
            if (expected == 0) {
                out.clear();
                ok = true;
            } else if (blob && uncompress(inflated.data(), &inflatedSize, static_cast<const Bytef*>(blob),
                                          static_cast<uLong>(blobSize)) == Z_OK) {
                out.assign(inflated.begin(), inflated.begin() + static_cast<std::ptrdiff_t>(inflatedSize));
                ok = true;
            } else {
                Logger::getInstance().error("[AuditStore] Could not inflate record #" + std::to_string(id));
            }
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return ok;
    }

    const std::string& DatabasePath() const { return m_dbFilePath; }

  private:
    bool openDatabase(sqlite3*& db) {
        int rc = sqlite3_open(m_dbFilePath.c_str(), &db);
        return (rc == SQLITE_OK && db != nullptr);
    }

    bool initDatabaseSchema(sqlite3* db) {
        const char* ddl = "CREATE TABLE IF NOT EXISTS redactions ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " created_at DATETIME DEFAULT CURRENT_TIMESTAMP,"
                          " original_path TEXT,"
                          " redacted_path TEXT,"
                          " original_sha256 TEXT,"
                          " redacted_sha256 TEXT,"
                          " format TEXT,"
                          " redaction_count INTEGER,"
                          " text_size INTEGER,"
                          " redacted_text BLOB"
                          ");";

        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            if (errMsg) {
                docredact::util::logger::Logger::getInstance().error(
                    "[AuditStore] initDatabaseSchema error: " + std::string(errMsg));
                sqlite3_free(errMsg);
            }
            return false;
        }
        return true;
    }

    std::string m_dbFilePath;
};

} // namespace audit
} // namespace docredact

#endif // DOCREDACT_AUDIT_AUDIT_STORE_HPP
