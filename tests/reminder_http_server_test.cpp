#include <gtest/gtest.h>

#include <thread>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "server/reminder_http_server.hpp"
#include "test_support.hpp"

namespace remindbot::server {
namespace {

using remindbot::reminder::ReminderKey;
using remindbot::reminder::ReminderService;
using remindbot::reminder::SchedulerEngine;
using remindbot::reminder::SqliteReminderStore;
using remindbot::testing::FakeClock;
using remindbot::testing::FakeNotifier;
using remindbot::testing::Local;

class ReminderHttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(remindbot::reminder::SetReferenceTimeZone("UTC"));
        clock_ = std::make_unique<FakeClock>(Local("2024-01-01 10:00:00"));
        service_ = std::make_unique<ReminderService>(store_, engine_, notifier_, 10,
                                                     [this]() { return clock_->Now(); });
        server_ = std::make_unique<ReminderHttpServer>(*service_, engine_);
        port_ = server_->BindToAnyPort("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_->ListenAfterBind(); });
        server_->WaitUntilReady();
        client_ = std::make_unique<httplib::Client>("127.0.0.1", port_);
    }

    void TearDown() override {
        server_->Stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    httplib::Result PostJson(const std::string& path, const nlohmann::json& body) {
        return client_->Post(path, body.dump(), "application/json");
    }

    static nlohmann::json Body(const httplib::Result& res) {
        return nlohmann::json::parse(res->body);
    }

    SqliteReminderStore store_{":memory:"};
    SchedulerEngine engine_{1};
    FakeNotifier notifier_;
    std::unique_ptr<FakeClock> clock_;
    std::unique_ptr<ReminderService> service_;
    std::unique_ptr<ReminderHttpServer> server_;
    std::thread thread_;
    int port_ = -1;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(ReminderHttpServerTest, CreateReturnsCreatedMessage) {
    const auto res = PostJson("/reminders", {{"agentId", "agent-a"},
                                             {"description", "Take pills"},
                                             {"recurrenceRule", "FREQ=DAILY;BYHOUR=21;BYMINUTE=30"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 201);
    EXPECT_EQ(Body(res).at("message"), "Reminder created (ID: 1). Next occurrence: 2024-01-01 21:30:00.");
    EXPECT_TRUE(engine_.IsScheduled(ReminderKey{"agent-a", 1}));
}

TEST_F(ReminderHttpServerTest, CreateErrorsMapToStatusCodes) {
    ASSERT_EQ(PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "x"}, {"delayMinutes", 5}})->status, 201);

    const auto duplicate = PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "x"}, {"delayMinutes", 5}});
    EXPECT_EQ(duplicate->status, 409);
    EXPECT_EQ(Body(duplicate).at("message"), "A reminder with the description \"x\" already exists.");

    const auto invalid = PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "y"}});
    EXPECT_EQ(invalid->status, 400);

    const auto bad_type = PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "z"}, {"delayMinutes", true}});
    EXPECT_EQ(bad_type->status, 400);

    const auto not_json = client_->Post("/reminders", "nope", "application/json");
    EXPECT_EQ(not_json->status, 400);
}

TEST_F(ReminderHttpServerTest, ListReturnsPagination) {
    for (int i = 0; i < 12; ++i) {
        ASSERT_EQ(PostJson("/reminders", {{"agentId", "agent-a"},
                                          {"description", "r" + std::to_string(i)},
                                          {"delayMinutes", 10}})->status, 201);
    }
    const auto res = client_->Get("/reminders?agentId=agent-a&page=1");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto body = Body(res);
    EXPECT_EQ(body.at("pagination").at("total"), 12);
    EXPECT_EQ(body.at("pagination").at("page"), 1);
    EXPECT_EQ(body.at("pagination").at("pageSize"), 10);
    EXPECT_EQ(body.at("pagination").at("totalPages"), 2);
    ASSERT_EQ(body.at("reminders").size(), 2u);
    const auto& first = body.at("reminders").at(0);
    EXPECT_EQ(first.at("id"), 11);
    EXPECT_EQ(first.at("agentId"), "agent-a");
    EXPECT_EQ(first.at("description"), "r10");
    EXPECT_TRUE(first.at("recurrenceRule").is_null());
    EXPECT_EQ(first.at("createdAt"), "2024-01-01 10:00:00");
    EXPECT_EQ(first.at("nextFireAt"), "2024-01-01 10:10:00");

    EXPECT_EQ(client_->Get("/reminders")->status, 400);
    EXPECT_EQ(client_->Get("/reminders?agentId=agent-a&page=-2")->status, 400);
}

TEST_F(ReminderHttpServerTest, DeleteByIdAndDescription) {
    PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "first"}, {"delayMinutes", 5}});
    PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "second thing"}, {"delayMinutes", 5}});

    const auto by_id = client_->Delete("/reminders/1?agentId=agent-a");
    ASSERT_TRUE(by_id);
    EXPECT_EQ(by_id->status, 200);
    EXPECT_EQ(Body(by_id).at("message"), "Reminder 1 deleted: first");

    const auto by_description = client_->Delete("/reminders?agentId=agent-a&description=second%20thing");
    EXPECT_EQ(by_description->status, 200);
    EXPECT_EQ(Body(by_description).at("message"), "Reminder 2 deleted: second thing");

    const auto missing = client_->Delete("/reminders/1?agentId=agent-a");
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(Body(missing).at("message"), "Reminder not found.");
    EXPECT_EQ(engine_.PendingCount(), 0u);
}

TEST_F(ReminderHttpServerTest, ToolsEndpointExecutesForAgent) {
    const auto defs = client_->Get("/tools?agentId=agent-a");
    ASSERT_TRUE(defs);
    EXPECT_EQ(Body(defs).at("tools").size(), 3u);

    const auto created = PostJson("/tools/create_reminder", {{"agentId", "agent-a"},
                                                             {"arguments", {{"description", "Stretch"},
                                                                            {"delay_minutes", 30}}}});
    ASSERT_TRUE(created);
    EXPECT_EQ(created->status, 200);
    EXPECT_EQ(Body(created).at("result"), "Reminder created (ID: 1). Next occurrence: 2024-01-01 10:30:00.");

    const auto listed = PostJson("/tools/list_reminders", {{"agentId", "agent-a"}, {"arguments", {{"page", 0}}}});
    EXPECT_EQ(Body(listed).at("result").get<std::string>().rfind("Showing 1 of 1 reminders (page 1/1):", 0), 0u);

    EXPECT_EQ(PostJson("/tools/unknown_tool", {{"agentId", "agent-a"}})->status, 404);
    EXPECT_EQ(PostJson("/tools/list_reminders", nlohmann::json::object())->status, 400);
}

TEST_F(ReminderHttpServerTest, HealthReportsPendingTimers) {
    PostJson("/reminders", {{"agentId", "agent-a"}, {"description", "x"}, {"delayMinutes", 5}});
    const auto res = client_->Get("/health");
    ASSERT_TRUE(res);
    const auto body = Body(res);
    EXPECT_EQ(body.at("status"), "ok");
    EXPECT_EQ(body.at("pending"), 1);
    EXPECT_EQ(body.at("nextWakeAt"), "2024-01-01 10:05:00");
}

}  // namespace
}  // namespace remindbot::server
