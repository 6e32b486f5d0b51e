#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "reminder/reminder_types.hpp"
#include "sqlite3.h"

namespace remindbot::reminder {

class ReminderStore {
public:
    virtual ~ReminderStore() = default;

    // Rejects a description already used by the agent. Ids are max(existing, ever assigned) + 1.
    virtual ReminderResult Create(const std::string& agent_id,
                                  const std::string& description,
                                  const std::optional<std::string>& recurrence_rule,
                                  std::optional<TimePoint> next_fire_at,
                                  TimePoint now) = 0;
    virtual ReminderResult Delete(const ReminderKey& key) = 0;
    virtual ReminderResult DeleteByDescription(const std::string& agent_id, const std::string& description) = 0;
    virtual ReminderResult UpdateSchedule(const ReminderKey& key,
                                          std::optional<TimePoint> next_fire_at,
                                          TimePoint modified_at) = 0;
    // Reads answer kNotFound for a missing row and kStoreFailure when sqlite fails.
    virtual ReminderResult Get(const ReminderKey& key) = 0;
    virtual ReminderResult GetByDescription(const std::string& agent_id, const std::string& description) = 0;
    virtual ReminderPage List(const std::string& agent_id, std::size_t page, std::size_t page_size = 10) = 0;
    // Every agent's reminders in insertion order, as one page.
    virtual ReminderPage ListAll() = 0;
};

class SqliteReminderStore : public ReminderStore {
public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteReminderStore(std::filesystem::path db_path);
    ~SqliteReminderStore() override;

    SqliteReminderStore(const SqliteReminderStore&) = delete;
    SqliteReminderStore& operator=(const SqliteReminderStore&) = delete;

    bool IsOpen() const { return db_ != nullptr; }

    ReminderResult Create(const std::string& agent_id,
                          const std::string& description,
                          const std::optional<std::string>& recurrence_rule,
                          std::optional<TimePoint> next_fire_at,
                          TimePoint now) override;
    ReminderResult Delete(const ReminderKey& key) override;
    ReminderResult DeleteByDescription(const std::string& agent_id, const std::string& description) override;
    ReminderResult UpdateSchedule(const ReminderKey& key,
                                  std::optional<TimePoint> next_fire_at,
                                  TimePoint modified_at) override;
    ReminderResult Get(const ReminderKey& key) override;
    ReminderResult GetByDescription(const std::string& agent_id, const std::string& description) override;
    ReminderPage List(const std::string& agent_id, std::size_t page, std::size_t page_size = 10) override;
    ReminderPage ListAll() override;

private:
    void EnsureSchema();
    ReminderResult FindByDescription(const std::string& agent_id, const std::string& description);
    ReminderResult FindById(const ReminderKey& key);
    ReminderResult FindOne(sqlite3_stmt* stmt);
    bool Remove(const ReminderKey& key);
    std::string LastError() const;
    static bool Exec(sqlite3* db, const std::string& sql);
    static Reminder ReadRow(sqlite3_stmt* stmt);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace remindbot::reminder
