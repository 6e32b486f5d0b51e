#pragma once

#include <memory>
#include <string>

#include "httplib.h"
#include "reminder/reminder_service.hpp"
#include "reminder/scheduler_engine.hpp"

namespace remindbot::server {

// JSON API over the reminder service:
//   POST   /reminders                      {agentId, description, recurrenceRule?, timestamp?, delayMinutes?}
//   DELETE /reminders/{id}?agentId=
//   DELETE /reminders?agentId=&description=
//   GET    /reminders?agentId=&page=        page is 0-based
//   GET    /tools?agentId=
//   POST   /tools/{name}                   {agentId, arguments}
//   GET    /health
class ReminderHttpServer {
public:
    ReminderHttpServer(remindbot::reminder::ReminderService& reminders,
                       const remindbot::reminder::SchedulerEngine& engine);

    ReminderHttpServer(const ReminderHttpServer&) = delete;
    ReminderHttpServer& operator=(const ReminderHttpServer&) = delete;

    // Blocks until Stop.
    bool Listen(const std::string& host, int port);
    // Binds an ephemeral port and returns it, or -1. Serve with ListenAfterBind.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    void Stop();
    void WaitUntilReady();

private:
    void RegisterRoutes();

    remindbot::reminder::ReminderService& reminders_;
    const remindbot::reminder::SchedulerEngine& engine_;
    httplib::Server server_;
};

}  // namespace remindbot::server
