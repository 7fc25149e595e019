#include "../../include/database/pg_record_store.hpp"
#include "../../include/utils/calendar.hpp"
#include "../../include/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace harvester {

namespace {

const char* kInsertRecordStmt = "insert_identity_record";
const char* kSelectExistingStmt = "select_existing_ids";
const char* kCatalogueSnapshotStmt = "catalogue_snapshot";
const char* kSelectRecordStmt = "select_identity_record";

const char* optionalParam(const std::optional<std::string>& value) {
    return value ? value->c_str() : nullptr;
}

int64_t toInt64(const char* text) {
    return text ? std::strtoll(text, nullptr, 10) : 0;
}

std::optional<std::string> optionalColumn(PGresult* res, int row, int column) {
    if (PQgetisnull(res, row, column)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(res, row, column));
}

std::string toArrayLiteral(std::vector<int64_t>::const_iterator begin,
                           std::vector<int64_t>::const_iterator end) {
    std::string literal = "{";
    for (auto it = begin; it != end; ++it) {
        if (it != begin) literal += ",";
        literal += std::to_string(*it);
    }
    literal += "}";
    return literal;
}

} // namespace

PgRecordStore::PgRecordStore(ConnectionPool& pool) : pool_(pool) {
}

bool PgRecordStore::initialize() {
    auto conn = pool_.acquire();

    PGresult* table = conn->executeQuery(
        "CREATE TABLE IF NOT EXISTS identity_records ("
        "  user_id BIGINT PRIMARY KEY,"
        "  username VARCHAR(64) CHECK (username IS NULL OR username LIKE '@%'),"
        "  first_name TEXT,"
        "  last_name TEXT,"
        "  phone VARCHAR(32),"
        "  is_premium BOOLEAN NOT NULL DEFAULT FALSE,"
        "  is_verified BOOLEAN NOT NULL DEFAULT FALSE,"
        "  is_bot BOOLEAN NOT NULL DEFAULT FALSE,"
        "  collected_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
        "  source_chat_id BIGINT NOT NULL,"
        "  source_chat_title TEXT,"
        "  last_message_at TIMESTAMPTZ,"
        "  collected_by VARCHAR(64)"
        ")");
    if (!table) {
        Logger::getInstance().error("Could not create identity_records table: " + conn->getLastError());
        return false;
    }
    PQclear(table);

    // Rows written before the '@' marker was enforced
    PGresult* legacy = conn->executeQuery(
        "UPDATE identity_records SET username = CASE "
        "  WHEN username = '' THEN NULL "
        "  ELSE '@' || username END "
        "WHERE username IS NOT NULL AND username NOT LIKE '@%'");
    if (!legacy) {
        Logger::getInstance().warning("Could not normalise legacy usernames: " + conn->getLastError());
    } else {
        const std::string touched = PQcmdTuples(legacy);
        PQclear(legacy);
        if (!touched.empty() && touched != "0") {
            Logger::getInstance().info("Normalised " + touched + " legacy usernames");
        }
    }

    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_identity_records_username ON identity_records (username)",
        "CREATE INDEX IF NOT EXISTS idx_identity_records_collected_at ON identity_records (collected_at DESC)",
        "CREATE INDEX IF NOT EXISTS idx_identity_records_source_chat ON identity_records (source_chat_id)",
    };
    for (const char* ddl : indexes) {
        PGresult* res = conn->executeQuery(ddl);
        if (!res) {
            Logger::getInstance().warning("Could not create index: " + conn->getLastError());
            continue;
        }
        PQclear(res);
    }

    PGresult* metadata = conn->executeQuery(
        "CREATE TABLE IF NOT EXISTS harvester_metadata ("
        "  key VARCHAR(64) PRIMARY KEY,"
        "  value TEXT NOT NULL,"
        "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ")");
    if (!metadata) {
        Logger::getInstance().error("Could not create harvester_metadata table: " + conn->getLastError());
        return false;
    }
    PQclear(metadata);

    PGresult* version = conn->executeQuery(
        std::string("INSERT INTO harvester_metadata (key, value) VALUES ('schema_version', '") + kSchemaVersion +
        "') ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, updated_at = now()");
    if (!version) {
        Logger::getInstance().warning("Could not record schema version: " + conn->getLastError());
    } else {
        PQclear(version);
    }

    PGresult* catalogue = conn->executeQuery(
        "CREATE TABLE IF NOT EXISTS backup_snapshots ("
        "  name VARCHAR(128) PRIMARY KEY,"
        "  created_at TIMESTAMPTZ NOT NULL,"
        "  row_count BIGINT NOT NULL"
        ")");
    if (!catalogue) {
        Logger::getInstance().error("Could not create backup_snapshots table: " + conn->getLastError());
        return false;
    }
    PQclear(catalogue);

    Logger::getInstance().info("Identity record schema ready (version " + std::string(kSchemaVersion) + ")");
    return true;
}

bool PgRecordStore::ensurePrepared(DatabaseConnection& conn) {
    // Each statement separately: an earlier call may have stopped halfway
    return (conn.isPrepared(kSelectExistingStmt) ||
            conn.prepareStatement(kSelectExistingStmt,
                "SELECT user_id FROM identity_records WHERE user_id = ANY($1::bigint[])")) &&
           (conn.isPrepared(kCatalogueSnapshotStmt) ||
            conn.prepareStatement(kCatalogueSnapshotStmt,
                "INSERT INTO backup_snapshots (name, created_at, row_count) VALUES ($1, to_timestamp($2), $3)")) &&
           (conn.isPrepared(kSelectRecordStmt) ||
            conn.prepareStatement(kSelectRecordStmt,
                "SELECT user_id, username, first_name, last_name, phone, is_premium, is_verified, is_bot, "
                "EXTRACT(EPOCH FROM collected_at)::bigint, source_chat_id, source_chat_title, "
                "EXTRACT(EPOCH FROM last_message_at)::bigint, collected_by "
                "FROM identity_records WHERE user_id = $1 LIMIT 1")) &&
           (conn.isPrepared(kInsertRecordStmt) ||
            conn.prepareStatement(kInsertRecordStmt,
                "INSERT INTO identity_records (user_id, username, first_name, last_name, phone, "
                "is_premium, is_verified, is_bot, collected_at, source_chat_id, source_chat_title, "
                "last_message_at, collected_by) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9), $10, $11, to_timestamp($12), $13) "
                "ON CONFLICT (user_id) DO NOTHING RETURNING user_id"));
}

bool PgRecordStore::existingIds(const std::vector<int64_t>& candidates,
                                std::unordered_set<int64_t>& found) {
    if (candidates.empty()) {
        return true;
    }

    auto conn = pool_.acquire();
    if (!ensurePrepared(*conn)) {
        return false;
    }

    for (size_t offset = 0; offset < candidates.size(); offset += kLookupChunkSize) {
        const size_t end = std::min(offset + kLookupChunkSize, candidates.size());
        const std::string ids = toArrayLiteral(candidates.begin() + offset, candidates.begin() + end);
        const char* params[1] = {ids.c_str()};

        PGresult* res = conn->executePrepared(kSelectExistingStmt, 1, params);
        if (!res) {
            return false;
        }
        const int rows = PQntuples(res);
        for (int i = 0; i < rows; i++) {
            found.insert(toInt64(PQgetvalue(res, i, 0)));
        }
        PQclear(res);
    }
    return true;
}

BatchInsertOutcome PgRecordStore::insertBatch(const std::vector<IdentityRecord>& records) {
    BatchInsertOutcome outcome;
    if (records.empty()) {
        outcome.ok = true;
        return outcome;
    }

    auto conn = pool_.acquire();
    if (!ensurePrepared(*conn)) {
        outcome.error = conn->getLastError();
        return outcome;
    }
    if (!conn->begin()) {
        outcome.error = conn->getLastError();
        return outcome;
    }

    for (const auto& record : records) {
        const std::string user_id = std::to_string(record.user_id);
        const std::string collected_at = std::to_string(record.collected_at);
        const std::string chat_id = std::to_string(record.source_chat_id);
        const std::string last_message_at = std::to_string(record.last_message_at);

        const char* params[13] = {
            user_id.c_str(),
            optionalParam(record.username),
            optionalParam(record.first_name),
            optionalParam(record.last_name),
            optionalParam(record.phone),
            record.is_premium ? "true" : "false",
            record.is_verified ? "true" : "false",
            record.is_bot ? "true" : "false",
            collected_at.c_str(),
            chat_id.c_str(),
            record.source_chat_title.c_str(),
            record.last_message_at > 0 ? last_message_at.c_str() : nullptr,
            record.collected_by.empty() ? nullptr : record.collected_by.c_str(),
        };

        PGresult* res = conn->executePrepared(kInsertRecordStmt, 13, params);
        if (!res) {
            outcome.error = "user " + user_id + ": " + conn->getLastError();
            outcome.inserted_ids.clear();
            conn->rollback();
            return outcome;
        }
        if (PQntuples(res) == 1) {
            outcome.inserted_ids.push_back(record.user_id);
        }
        PQclear(res);
    }

    if (!conn->commit()) {
        outcome.error = "commit failed: " + conn->getLastError();
        outcome.inserted_ids.clear();
        conn->rollback();
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

std::string PgRecordStore::nextSnapshotName() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);
    std::ostringstream name;
    name << "identity_records_backup_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
         << "_" << std::setfill('0') << std::setw(3) << ms.count()
         << "_" << snapshot_seq_.fetch_add(1);
    return name.str();
}

std::optional<BackupSnapshot> PgRecordStore::snapshot(std::string& error) {
    auto conn = pool_.acquire();
    if (!ensurePrepared(*conn)) {
        error = conn->getLastError();
        return std::nullopt;
    }

    BackupSnapshot backup;
    backup.name = nextSnapshotName();
    backup.created_at = calendar::nowEpochSeconds();
    const std::string table = conn->escapeIdentifier(backup.name);

    if (!conn->begin()) {
        error = conn->getLastError();
        return std::nullopt;
    }

    auto fail = [&](const std::string& step) -> std::optional<BackupSnapshot> {
        error = step + ": " + conn->getLastError();
        conn->rollback();
        Logger::getInstance().error("Backup failed, " + error);
        return std::nullopt;
    };

    // SHARE mode blocks writers until commit but lets readers through
    PGresult* lock = conn->executeQuery("LOCK TABLE identity_records IN SHARE MODE");
    if (!lock) return fail("lock");
    PQclear(lock);

    PGresult* copy = conn->executeQuery("CREATE TABLE " + table + " AS TABLE identity_records");
    if (!copy) return fail("copy");
    PQclear(copy);

    PGresult* count = conn->executeQuery("SELECT COUNT(*) FROM " + table);
    if (!count) return fail("count");
    backup.row_count = toInt64(PQgetvalue(count, 0, 0));
    PQclear(count);

    const std::string created_at = std::to_string(backup.created_at);
    const std::string row_count = std::to_string(backup.row_count);
    const char* params[3] = {backup.name.c_str(), created_at.c_str(), row_count.c_str()};
    PGresult* entry = conn->executePrepared(kCatalogueSnapshotStmt, 3, params);
    if (!entry) return fail("catalogue");
    PQclear(entry);

    if (!conn->commit()) return fail("commit");

    Logger::getInstance().info("Created backup: " + backup.name + " (" + row_count + " rows)");
    return backup;
}

std::optional<IdentityRecord> PgRecordStore::findById(int64_t user_id) {
    auto conn = pool_.acquire();
    if (!ensurePrepared(*conn)) {
        return std::nullopt;
    }

    const std::string id = std::to_string(user_id);
    const char* params[1] = {id.c_str()};
    PGresult* res = conn->executePrepared(kSelectRecordStmt, 1, params);
    if (!res) {
        Logger::getInstance().error("Error getting user by ID " + id + ": " + conn->getLastError());
        return std::nullopt;
    }
    if (PQntuples(res) == 0) {
        PQclear(res);
        return std::nullopt;
    }

    IdentityRecord record;
    record.user_id = toInt64(PQgetvalue(res, 0, 0));
    record.username = optionalColumn(res, 0, 1);
    record.first_name = optionalColumn(res, 0, 2);
    record.last_name = optionalColumn(res, 0, 3);
    record.phone = optionalColumn(res, 0, 4);
    record.is_premium = std::string(PQgetvalue(res, 0, 5)) == "t";
    record.is_verified = std::string(PQgetvalue(res, 0, 6)) == "t";
    record.is_bot = std::string(PQgetvalue(res, 0, 7)) == "t";
    record.collected_at = toInt64(PQgetvalue(res, 0, 8));
    record.source_chat_id = toInt64(PQgetvalue(res, 0, 9));
    record.source_chat_title = optionalColumn(res, 0, 10).value_or("");
    if (!PQgetisnull(res, 0, 11)) record.last_message_at = toInt64(PQgetvalue(res, 0, 11));
    record.collected_by = optionalColumn(res, 0, 12).value_or("");
    PQclear(res);
    return record;
}

std::optional<StoreStats> PgRecordStore::stats() {
    auto conn = pool_.acquire();
    PGresult* res = conn->executeQuery(
        "SELECT COUNT(*),"
        " COUNT(username),"
        " COUNT(*) FILTER (WHERE is_premium),"
        " COUNT(*) FILTER (WHERE is_verified),"
        " COUNT(*) FILTER (WHERE is_bot),"
        " COUNT(DISTINCT source_chat_id),"
        " EXTRACT(EPOCH FROM MIN(collected_at))::bigint,"
        " EXTRACT(EPOCH FROM MAX(collected_at))::bigint "
        "FROM identity_records");
    if (!res) {
        return std::nullopt;
    }

    StoreStats stats;
    stats.total_users = toInt64(PQgetvalue(res, 0, 0));
    stats.with_username = toInt64(PQgetvalue(res, 0, 1));
    stats.premium_users = toInt64(PQgetvalue(res, 0, 2));
    stats.verified_users = toInt64(PQgetvalue(res, 0, 3));
    stats.bot_accounts = toInt64(PQgetvalue(res, 0, 4));
    stats.source_chats = toInt64(PQgetvalue(res, 0, 5));
    if (!PQgetisnull(res, 0, 6)) stats.first_collected_at = toInt64(PQgetvalue(res, 0, 6));
    if (!PQgetisnull(res, 0, 7)) stats.last_collected_at = toInt64(PQgetvalue(res, 0, 7));
    PQclear(res);
    return stats;
}

std::optional<int64_t> PgRecordStore::lastCollectedAt() {
    auto conn = pool_.acquire();
    PGresult* res = conn->executeQuery(
        "SELECT EXTRACT(EPOCH FROM MAX(collected_at))::bigint FROM identity_records");
    if (!res) {
        return std::nullopt;
    }
    std::optional<int64_t> last;
    if (PQntuples(res) == 1 && !PQgetisnull(res, 0, 0)) {
        last = toInt64(PQgetvalue(res, 0, 0));
    }
    PQclear(res);
    return last;
}

} // namespace harvester
