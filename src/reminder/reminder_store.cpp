#include "reminder/reminder_store.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace remindbot::reminder {
namespace {

using remindbot::utils::LogLevel;

constexpr const char* kSelectColumns =
    "SELECT id, agent_id, description, recurrence_rule, next_fire_at_ms, created_at_ms, modified_at_ms "
    "FROM reminders ";

void BindOptionalTime(sqlite3_stmt* stmt, int index, const std::optional<TimePoint>& value) {
    if (value.has_value()) {
        sqlite3_bind_int64(stmt, index, remindbot::utils::ToMs(*value));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

}  // namespace

SqliteReminderStore::SqliteReminderStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

SqliteReminderStore::~SqliteReminderStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

ReminderResult SqliteReminderStore::Create(const std::string& agent_id,
                                           const std::string& description,
                                           const std::optional<std::string>& recurrence_rule,
                                           std::optional<TimePoint> next_fire_at,
                                           TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, "reminder store is not open");
    }
    if (!Exec(db_, "BEGIN IMMEDIATE;")) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    auto fail = [this](ReminderStatus status, std::string detail) {
        Exec(db_, "ROLLBACK;");
        return ReminderResult::Fail(status, std::move(detail));
    };

    const auto duplicate = FindByDescription(agent_id, description);
    if (duplicate.status == ReminderStatus::kStoreFailure) {
        return fail(ReminderStatus::kStoreFailure, duplicate.detail);
    }
    if (duplicate.ok()) {
        return fail(ReminderStatus::kDuplicateDescription,
                    "A reminder with the description \"" + description + "\" already exists.");
    }

    sqlite3_stmt* stmt = nullptr;
    const std::string next_id_sql =
        "SELECT MAX(COALESCE((SELECT MAX(id) FROM reminders WHERE agent_id = ?1), 0), "
        "COALESCE((SELECT last_id FROM agent_counters WHERE agent_id = ?1), 0)) + 1;";
    if (sqlite3_prepare_v2(db_, next_id_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return fail(ReminderStatus::kStoreFailure, LastError());
    }
    const long long next_id = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);

    Reminder reminder;
    reminder.id = next_id;
    reminder.agent_id = agent_id;
    reminder.description = description;
    reminder.recurrence_rule = recurrence_rule;
    reminder.next_fire_at = next_fire_at;
    reminder.created_at = now;
    reminder.modified_at = now;

    const std::string insert_sql =
        "INSERT INTO reminders(agent_id, id, description, recurrence_rule, next_fire_at_ms, created_at_ms, modified_at_ms) "
        "VALUES(?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, next_id);
    sqlite3_bind_text(stmt, 3, description.c_str(), -1, SQLITE_TRANSIENT);
    if (recurrence_rule.has_value()) {
        sqlite3_bind_text(stmt, 4, recurrence_rule->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    BindOptionalTime(stmt, 5, next_fire_at);
    sqlite3_bind_int64(stmt, 6, remindbot::utils::ToMs(now));
    sqlite3_bind_int64(stmt, 7, remindbot::utils::ToMs(now));
    const auto insert_rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (insert_rc != SQLITE_DONE) {
        return fail(ReminderStatus::kStoreFailure, LastError());
    }

    const std::string counter_sql =
        "INSERT INTO agent_counters(agent_id, last_id) VALUES(?, ?) "
        "ON CONFLICT(agent_id) DO UPDATE SET last_id = excluded.last_id;";
    if (sqlite3_prepare_v2(db_, counter_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, next_id);
    const auto counter_rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (counter_rc != SQLITE_DONE) {
        return fail(ReminderStatus::kStoreFailure, LastError());
    }

    if (!Exec(db_, "COMMIT;")) {
        return fail(ReminderStatus::kStoreFailure, LastError());
    }
    return ReminderResult::Ok(std::move(reminder));
}

ReminderResult SqliteReminderStore::Delete(const ReminderKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, "reminder store is not open");
    }
    auto existing = FindById(key);
    if (!existing.ok()) {
        return existing;
    }
    if (!Remove(key)) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    return existing;
}

ReminderResult SqliteReminderStore::DeleteByDescription(const std::string& agent_id, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, "reminder store is not open");
    }
    auto existing = FindByDescription(agent_id, description);
    if (!existing.ok()) {
        return existing;
    }
    if (!Remove(existing.reminder.Key())) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    return existing;
}

ReminderResult SqliteReminderStore::UpdateSchedule(const ReminderKey& key,
                                                   std::optional<TimePoint> next_fire_at,
                                                   TimePoint modified_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, "reminder store is not open");
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "UPDATE reminders SET next_fire_at_ms = ?, modified_at_ms = ? WHERE agent_id = ? AND id = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    BindOptionalTime(stmt, 1, next_fire_at);
    sqlite3_bind_int64(stmt, 2, remindbot::utils::ToMs(modified_at));
    sqlite3_bind_text(stmt, 3, key.agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, key.id);
    const auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    if (sqlite3_changes(db_) == 0) {
        return ReminderResult::Fail(ReminderStatus::kNotFound, "Reminder not found.");
    }
    return FindById(key);
}

ReminderResult SqliteReminderStore::Get(const ReminderKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindById(key);
}

ReminderResult SqliteReminderStore::GetByDescription(const std::string& agent_id,
                                                    const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindByDescription(agent_id, description);
}

ReminderPage SqliteReminderStore::List(const std::string& agent_id, std::size_t page, std::size_t page_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReminderPage result;
    result.page = page;
    result.page_size = page_size == 0 ? 10 : page_size;
    auto fail = [this, &result]() {
        result.status = ReminderStatus::kStoreFailure;
        result.detail = LastError();
        result.items.clear();
        return result;
    };
    if (!db_) {
        return fail();
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM reminders WHERE agent_id = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return fail();
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return fail();
    }
    result.total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    result.total_pages = (result.total + result.page_size - 1) / result.page_size;
    if (page >= result.total_pages) {
        return result;
    }

    const std::string sql = std::string(kSelectColumns) + "WHERE agent_id = ? ORDER BY seq ASC LIMIT ? OFFSET ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return fail();
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(result.page_size));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(page * result.page_size));
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.items.push_back(ReadRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail();
    }
    return result;
}

ReminderPage SqliteReminderStore::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    ReminderPage result;
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kSelectColumns) + "ORDER BY seq ASC;";
    int rc = SQLITE_ERROR;
    if (db_ && sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            result.items.push_back(ReadRow(stmt));
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        result.status = ReminderStatus::kStoreFailure;
        result.detail = LastError();
        result.items.clear();
        return result;
    }
    result.total = result.items.size();
    result.page_size = result.items.size();
    result.total_pages = result.items.empty() ? 0 : 1;
    return result;
}

void SqliteReminderStore::EnsureSchema() {
    if (db_) {
        return;
    }
    const auto path = db_path_.string();
    if (path != ":memory:" && db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        remindbot::utils::Log("store", LogLevel::kError, "failed to open sqlite db: " + path);
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, 5000);
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS reminders ("
             "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
             "agent_id TEXT NOT NULL,"
             "id INTEGER NOT NULL,"
             "description TEXT NOT NULL,"
             "recurrence_rule TEXT,"
             "next_fire_at_ms INTEGER,"
             "created_at_ms INTEGER NOT NULL,"
             "modified_at_ms INTEGER NOT NULL,"
             "UNIQUE(agent_id, id)"
             ");");
    Exec(db_, "CREATE TABLE IF NOT EXISTS agent_counters ("
             "agent_id TEXT PRIMARY KEY,"
             "last_id INTEGER NOT NULL"
             ");");
    Exec(db_, "CREATE INDEX IF NOT EXISTS idx_reminders_description ON reminders(agent_id, description);");
}

ReminderResult SqliteReminderStore::FindByDescription(const std::string& agent_id,
                                                     const std::string& description) {
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kSelectColumns) + "WHERE agent_id = ? AND description = ? ORDER BY seq ASC LIMIT 1;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_bind_text(stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, description.c_str(), -1, SQLITE_TRANSIENT);
    return FindOne(stmt);
}

ReminderResult SqliteReminderStore::FindById(const ReminderKey& key) {
    if (!db_) {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kSelectColumns) + "WHERE agent_id = ? AND id = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_bind_text(stmt, 1, key.agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, key.id);
    return FindOne(stmt);
}

// Steps a bound single-row query and finalizes it.
ReminderResult SqliteReminderStore::FindOne(sqlite3_stmt* stmt) {
    const auto rc = sqlite3_step(stmt);
    ReminderResult result;
    if (rc == SQLITE_ROW) {
        result = ReminderResult::Ok(ReadRow(stmt));
    } else if (rc == SQLITE_DONE) {
        result = ReminderResult::Fail(ReminderStatus::kNotFound, "Reminder not found.");
    } else {
        result = ReminderResult::Fail(ReminderStatus::kStoreFailure, LastError());
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteReminderStore::Remove(const ReminderKey& key) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM reminders WHERE agent_id = ? AND id = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, key.id);
    const auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::string SqliteReminderStore::LastError() const {
    return db_ ? std::string(sqlite3_errmsg(db_)) : std::string("reminder store is not open");
}

bool SqliteReminderStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            remindbot::utils::Log("store", LogLevel::kError, std::string("sqlite exec error: ") + err);
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

Reminder SqliteReminderStore::ReadRow(sqlite3_stmt* stmt) {
    Reminder reminder;
    reminder.id = sqlite3_column_int64(stmt, 0);
    reminder.agent_id = SafeText(sqlite3_column_text(stmt, 1));
    reminder.description = SafeText(sqlite3_column_text(stmt, 2));
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        reminder.recurrence_rule = SafeText(sqlite3_column_text(stmt, 3));
    }
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        reminder.next_fire_at = remindbot::utils::FromMs(sqlite3_column_int64(stmt, 4));
    }
    reminder.created_at = remindbot::utils::FromMs(sqlite3_column_int64(stmt, 5));
    reminder.modified_at = remindbot::utils::FromMs(sqlite3_column_int64(stmt, 6));
    return reminder;
}

std::string SqliteReminderStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace remindbot::reminder
