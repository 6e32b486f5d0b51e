#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"

namespace remindbot::notifier {

struct DeliveryResult {
    bool ok = false;
    int http_status = 0;
    std::string error;
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual DeliveryResult Notify(const std::string& agent_id, const std::string& text) = 0;
};

// POSTs {"message": text} to {base_url}/agents/{agent_id}/messages with a bearer token.
class HttpNotifier : public Notifier {
public:
    explicit HttpNotifier(remindbot::config::NotifierConfig config);

    DeliveryResult Notify(const std::string& agent_id, const std::string& text) override;

private:
    remindbot::config::NotifierConfig config_;
};

std::unique_ptr<Notifier> CreateNotifier(const remindbot::config::Config& config);

}  // namespace remindbot::notifier
