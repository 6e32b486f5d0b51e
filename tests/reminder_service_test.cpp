#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "reminder/reminder_service.hpp"
#include "test_support.hpp"

namespace remindbot::reminder {
namespace {

using namespace std::chrono_literals;
using remindbot::testing::FakeClock;
using remindbot::testing::FakeNotifier;
using remindbot::testing::Local;
using remindbot::utils::FormatLocalTime;

constexpr const char* kDailyRule = "FREQ=DAILY;BYHOUR=21;BYMINUTE=30";

// SQLite store whose reads can be made to fail, and which can run a hook right after an insert.
class FlakyStore : public SqliteReminderStore {
public:
    using SqliteReminderStore::SqliteReminderStore;

    void SetFailingReads(bool failing) { failing_reads_ = failing; }
    void SetAfterCreate(std::function<void(const Reminder&)> hook) { after_create_ = std::move(hook); }

    ReminderResult Create(const std::string& agent_id,
                          const std::string& description,
                          const std::optional<std::string>& recurrence_rule,
                          std::optional<TimePoint> next_fire_at,
                          TimePoint now) override {
        auto result = SqliteReminderStore::Create(agent_id, description, recurrence_rule, next_fire_at, now);
        if (result.ok() && after_create_) {
            after_create_(result.reminder);
        }
        return result;
    }
    ReminderResult Get(const ReminderKey& key) override {
        return failing_reads_ ? Failure() : SqliteReminderStore::Get(key);
    }
    ReminderResult GetByDescription(const std::string& agent_id, const std::string& description) override {
        return failing_reads_ ? Failure() : SqliteReminderStore::GetByDescription(agent_id, description);
    }
    ReminderPage List(const std::string& agent_id, std::size_t page, std::size_t page_size = 10) override {
        if (!failing_reads_) {
            return SqliteReminderStore::List(agent_id, page, page_size);
        }
        ReminderPage failed;
        failed.status = ReminderStatus::kStoreFailure;
        failed.detail = "disk I/O error";
        return failed;
    }

private:
    static ReminderResult Failure() {
        return ReminderResult::Fail(ReminderStatus::kStoreFailure, "disk I/O error");
    }

    std::atomic<bool> failing_reads_{false};
    std::function<void(const Reminder&)> after_create_;
};

class ReminderServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SetReferenceTimeZone("UTC"));
        ASSERT_TRUE(store_.IsOpen());
        clock_ = std::make_unique<FakeClock>(Local("2024-01-01 10:00:00"));
        service_ = std::make_unique<ReminderService>(store_, engine_, notifier_, 10,
                                                     [this]() { return clock_->Now(); });
    }

    static ScheduleRequest Rule(const std::string& rule) {
        ScheduleRequest request;
        request.recurrence_rule = rule;
        return request;
    }

    static ScheduleRequest Delay(long long minutes) {
        ScheduleRequest request;
        request.delay_minutes = minutes;
        return request;
    }

    ReminderJob JobFor(const ReminderKey& key) {
        const auto stored = store_.Get(key);
        EXPECT_TRUE(stored.ok());
        return ReminderJob{key, stored.reminder.description, stored.reminder.recurrence_rule,
                           stored.reminder.created_at};
    }

    FlakyStore store_{":memory:"};
    SchedulerEngine engine_{1};
    FakeNotifier notifier_;
    std::unique_ptr<FakeClock> clock_;
    std::unique_ptr<ReminderService> service_;
};

TEST_F(ReminderServiceTest, CreateDailyRuleReportsNextOccurrence) {
    EXPECT_EQ(service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule)),
              "Reminder created (ID: 1). Next occurrence: 2024-01-01 21:30:00.");
    const ReminderKey key{"agent-a", 1};
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-01 21:30:00"));
    EXPECT_EQ(store_.Get(key).reminder.next_fire_at, Local("2024-01-01 21:30:00"));
}

TEST_F(ReminderServiceTest, CreateWithDelay) {
    EXPECT_EQ(service_->CreateReminder("agent-a", "Stretch", Delay(30)),
              "Reminder created (ID: 1). Next occurrence: 2024-01-01 10:30:00.");
    const auto stored = store_.Get(ReminderKey{"agent-a", 1});
    ASSERT_TRUE(stored.ok());
    EXPECT_FALSE(stored.reminder.recurrence_rule.has_value());
}

TEST_F(ReminderServiceTest, CreateRejectsDuplicatesAndBadInput) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    EXPECT_EQ(service_->CreateReminder("agent-a", "Take pills", Delay(5)),
              "A reminder with the description \"Take pills\" already exists.");
    EXPECT_EQ(service_->CreateReminder("agent-a", "Nothing", ScheduleRequest{}),
              "Error: one of recurrence_rule, timestamp or delay_minutes is required");
    EXPECT_EQ(service_->CreateReminder("agent-a", "Broken", Rule("FREQ=NEVER")).rfind("Error: ", 0), 0u);
    EXPECT_EQ(service_->CreateReminder("agent-a", "  ", Delay(5)), "Error: description is required");
    EXPECT_EQ(engine_.PendingCount(), 1u);
    EXPECT_EQ(store_.List("agent-a", 0).total, 1u);
}

TEST_F(ReminderServiceTest, FireNotifiesAndReschedulesRecurring) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    const ReminderKey key{"agent-a", 1};
    clock_->Set(Local("2024-01-01 21:30:00"));
    service_->HandleFire(JobFor(key));

    const auto deliveries = notifier_.Deliveries();
    ASSERT_EQ(deliveries.size(), 1u);
    EXPECT_EQ(deliveries[0].agent_id, "agent-a");
    EXPECT_EQ(deliveries[0].text, "[Reminder] It is now 2024-01-01 21:30:00. Reminder: Take pills");

    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-02 21:30:00"));
    const auto stored = store_.Get(key);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.reminder.next_fire_at, Local("2024-01-02 21:30:00"));
    EXPECT_EQ(stored.reminder.modified_at, Local("2024-01-01 21:30:00"));
}

TEST_F(ReminderServiceTest, OneShotRetiresAfterFiring) {
    service_->CreateReminder("agent-a", "Stretch", Delay(30));
    const ReminderKey key{"agent-a", 1};
    clock_->Set(Local("2024-01-01 10:30:00"));
    service_->HandleFire(JobFor(key));
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_FALSE(store_.Get(key).ok());
    EXPECT_FALSE(engine_.IsScheduled(key));
}

TEST_F(ReminderServiceTest, CountOfOneRetiresAfterSingleFire) {
    service_->CreateReminder("agent-a", "Once", Rule("FREQ=DAILY;COUNT=1;BYHOUR=12;BYMINUTE=0"));
    const ReminderKey key{"agent-a", 1};
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-01 12:00:00"));
    clock_->Set(Local("2024-01-01 12:00:00"));
    service_->HandleFire(JobFor(key));
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_FALSE(store_.Get(key).ok());
    EXPECT_FALSE(engine_.IsScheduled(key));
}

TEST_F(ReminderServiceTest, DeliveryFailureStillReschedules) {
    notifier_.SetSucceed(false);
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    const ReminderKey key{"agent-a", 1};
    clock_->Set(Local("2024-01-01 21:30:00"));
    service_->HandleFire(JobFor(key));
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-02 21:30:00"));
}

TEST_F(ReminderServiceTest, FireAfterDeleteIsDropped) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    const ReminderKey key{"agent-a", 1};
    const auto job = JobFor(key);
    EXPECT_EQ(service_->DeleteReminder("agent-a", 1, std::nullopt), "Reminder 1 deleted: Take pills");
    service_->HandleFire(job);
    EXPECT_TRUE(notifier_.Deliveries().empty());
    EXPECT_FALSE(engine_.IsScheduled(key));
    EXPECT_FALSE(store_.Get(key).ok());
}

TEST_F(ReminderServiceTest, DeleteCancelsTimer) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    service_->CreateReminder("agent-a", "Stretch", Delay(30));
    EXPECT_EQ(service_->DeleteReminder("agent-a", std::nullopt, std::string("Stretch")),
              "Reminder 2 deleted: Stretch");
    EXPECT_FALSE(engine_.IsScheduled(ReminderKey{"agent-a", 2}));
    EXPECT_TRUE(engine_.IsScheduled(ReminderKey{"agent-a", 1}));
}

TEST_F(ReminderServiceTest, DeleteFallsBackToDescriptionWhenIdMisses) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    EXPECT_EQ(service_->DeleteReminder("agent-a", 42, std::string("Take pills")),
              "Reminder 1 deleted: Take pills");
}

TEST_F(ReminderServiceTest, DeletePrefersIdOverDescription) {
    service_->CreateReminder("agent-a", "first", Delay(5));
    service_->CreateReminder("agent-a", "second", Delay(5));
    EXPECT_EQ(service_->DeleteReminder("agent-a", 2, std::string("first")), "Reminder 2 deleted: second");
    EXPECT_TRUE(store_.Get(ReminderKey{"agent-a", 1}).ok());
}

TEST_F(ReminderServiceTest, DeleteReportsMissingAndInvalid) {
    EXPECT_EQ(service_->DeleteReminder("agent-a", 7, std::nullopt), "Reminder not found.");
    EXPECT_EQ(service_->DeleteReminder("agent-a", std::nullopt, std::string("nope")), "Reminder not found.");
    EXPECT_EQ(service_->DeleteReminder("agent-a", std::nullopt, std::nullopt),
              "Error: reminder id or description is required");
}

TEST_F(ReminderServiceTest, ListFormatsPages) {
    EXPECT_EQ(service_->ListReminders("agent-a", 0), "No reminders found.");
    for (int i = 0; i < 25; ++i) {
        service_->CreateReminder("agent-a", "r" + std::to_string(i), Delay(60));
    }
    service_->CreateReminder("agent-a", "daily", Rule(kDailyRule));

    const auto first = service_->ListReminders("agent-a", 0);
    EXPECT_EQ(first.rfind("Showing 10 of 26 reminders (page 1/3):\n", 0), 0u);
    EXPECT_NE(first.find("ID: 1, Description: r0, Recurrence Rule: None, "
                         "Created At: 2024-01-01 10:00:00, Modified At: 2024-01-01 10:00:00"),
              std::string::npos);

    const auto last = service_->ListReminders("agent-a", 2);
    EXPECT_EQ(last.rfind("Showing 6 of 26 reminders (page 3/3):", 0), 0u);
    EXPECT_NE(last.find("Recurrence Rule: " + std::string(kDailyRule)), std::string::npos);

    EXPECT_EQ(service_->ListReminders("agent-a", 3), "No reminders found.");
    EXPECT_EQ(service_->ListReminders("agent-b", 0), "No reminders found.");
}

TEST_F(ReminderServiceTest, RestoreReregistersPersistedReminders) {
    const auto created_at = Local("2024-01-01 08:00:00");
    ASSERT_TRUE(store_.Create("agent-a", "stored", std::nullopt, Local("2024-01-01 11:00:00"), created_at).ok());
    ASSERT_TRUE(store_.Create("agent-a", "recurring", std::string(kDailyRule), std::nullopt, created_at).ok());
    ASSERT_TRUE(store_.Create("agent-a", "orphan", std::nullopt, std::nullopt, created_at).ok());

    EXPECT_EQ(service_->Restore(), 2u);
    EXPECT_EQ(engine_.NextFireAt(ReminderKey{"agent-a", 1}), Local("2024-01-01 11:00:00"));
    EXPECT_EQ(engine_.NextFireAt(ReminderKey{"agent-a", 2}), Local("2024-01-01 21:30:00"));
    EXPECT_FALSE(store_.Get(ReminderKey{"agent-a", 3}).ok());
}

TEST_F(ReminderServiceTest, OverdueReminderFiresOnceAfterRestartThenContinues) {
    ASSERT_TRUE(store_.Create("agent-a", "Take pills", std::string(kDailyRule),
                              Local("2023-12-30 21:30:00"), Local("2023-12-29 09:00:00")).ok());
    ASSERT_EQ(service_->Restore(), 1u);
    const ReminderKey key{"agent-a", 1};
    EXPECT_EQ(engine_.NextFireAt(key), Local("2023-12-30 21:30:00"));

    service_->HandleFire(JobFor(key));
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-01 21:30:00"));
}

TEST_F(ReminderServiceTest, StoreReadFailuresAreReportedAsErrors) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    store_.SetFailingReads(true);
    EXPECT_EQ(service_->ListReminders("agent-a", 0), "Error: disk I/O error");
    EXPECT_EQ(service_->DeleteReminder("agent-a", 1, std::nullopt), "Error: disk I/O error");
    EXPECT_EQ(service_->DeleteReminder("agent-a", std::nullopt, std::string("Take pills")), "Error: disk I/O error");
    EXPECT_FALSE(service_->List("agent-a", 0).ok());
    EXPECT_TRUE(engine_.IsScheduled(ReminderKey{"agent-a", 1}));

    store_.SetFailingReads(false);
    EXPECT_EQ(service_->DeleteReminder("agent-a", 1, std::nullopt), "Reminder 1 deleted: Take pills");
}

TEST_F(ReminderServiceTest, FireRetriesWhenStoreReadFails) {
    service_->CreateReminder("agent-a", "Take pills", Rule(kDailyRule));
    const ReminderKey key{"agent-a", 1};
    const auto job = JobFor(key);
    clock_->Set(Local("2024-01-01 21:30:00"));

    store_.SetFailingReads(true);
    service_->HandleFire(job);
    store_.SetFailingReads(false);

    EXPECT_TRUE(notifier_.Deliveries().empty());
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-01 21:31:00"));
    EXPECT_TRUE(store_.Get(key).ok());

    clock_->Set(Local("2024-01-01 21:31:00"));
    service_->HandleFire(job);
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_EQ(engine_.NextFireAt(key), Local("2024-01-02 21:30:00"));
}

TEST_F(ReminderServiceTest, StoredRuleThatNoLongerParsesRetiresOnFire) {
    ASSERT_TRUE(store_.Create("agent-a", "broken", std::string("FREQ=NEVER"),
                              Local("2024-01-01 11:00:00"), Local("2024-01-01 09:00:00")).ok());
    const ReminderKey key{"agent-a", 1};
    ASSERT_EQ(service_->Restore(), 1u);

    clock_->Set(Local("2024-01-01 11:00:00"));
    service_->HandleFire(JobFor(key));
    EXPECT_EQ(notifier_.Deliveries().size(), 1u);
    EXPECT_EQ(store_.Get(key).status, ReminderStatus::kNotFound);
    EXPECT_FALSE(engine_.IsScheduled(key));
}

TEST_F(ReminderServiceTest, StoredRuleThatNoLongerParsesRetiresOnRestore) {
    ASSERT_TRUE(store_.Create("agent-a", "broken", std::string("FREQ=NEVER"),
                              std::nullopt, Local("2024-01-01 09:00:00")).ok());
    ASSERT_TRUE(store_.Create("agent-a", "fine", std::string(kDailyRule),
                              std::nullopt, Local("2024-01-01 09:00:00")).ok());
    EXPECT_EQ(service_->Restore(), 1u);
    EXPECT_EQ(store_.Get(ReminderKey{"agent-a", 1}).status, ReminderStatus::kNotFound);
    EXPECT_FALSE(engine_.IsScheduled(ReminderKey{"agent-a", 1}));
    EXPECT_TRUE(engine_.IsScheduled(ReminderKey{"agent-a", 2}));
}

TEST_F(ReminderServiceTest, DeleteLandingBeforeRegistrationLeavesNoTimer) {
    store_.SetAfterCreate([this](const Reminder& reminder) {
        ASSERT_TRUE(store_.Delete(reminder.Key()).ok());
    });
    EXPECT_EQ(service_->Create("agent-a", "Stretch", Delay(30)).status, ReminderStatus::kOk);
    EXPECT_FALSE(engine_.IsScheduled(ReminderKey{"agent-a", 1}));
    EXPECT_EQ(engine_.PendingCount(), 0u);
}

TEST_F(ReminderServiceTest, DeleteRacingFireLeavesNothingBehind) {
    for (int round = 0; round < 20; ++round) {
        const auto description = "race " + std::to_string(round);
        ASSERT_EQ(service_->Create("agent-a", description, Rule(kDailyRule)).status, ReminderStatus::kOk);
        const auto created = store_.GetByDescription("agent-a", description);
        ASSERT_TRUE(created.ok());
        const auto job = JobFor(created.reminder.Key());

        std::thread fire([&]() { service_->HandleFire(job); });
        std::thread remove([&]() { service_->Delete("agent-a", created.reminder.id, std::nullopt); });
        fire.join();
        remove.join();

        EXPECT_FALSE(store_.Get(created.reminder.Key()).ok());
        EXPECT_FALSE(engine_.IsScheduled(created.reminder.Key()));
    }
}

TEST(ReminderServiceEndToEndTest, PastTimestampFiresImmediatelyAndRetires) {
    ASSERT_TRUE(SetReferenceTimeZone("UTC"));
    SqliteReminderStore store(":memory:");
    SchedulerEngine engine(2);
    FakeNotifier notifier;
    ReminderService service(store, engine, notifier);
    engine.Start();

    ScheduleRequest request;
    request.timestamp = FormatLocalTime(std::chrono::system_clock::now() - 1min);
    ASSERT_EQ(service.Create("agent-a", "Late", request).status, ReminderStatus::kOk);
    ASSERT_TRUE(notifier.WaitForDeliveries(1, 3s));
    EXPECT_NE(notifier.Deliveries()[0].text.find("Reminder: Late"), std::string::npos);

    for (int i = 0; i < 50 && store.Get(ReminderKey{"agent-a", 1}).ok(); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(store.Get(ReminderKey{"agent-a", 1}).ok());
    engine.Stop();
}

}  // namespace
}  // namespace remindbot::reminder
