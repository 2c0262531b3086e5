#pragma once
#include "ledger/event_sink.hpp"
#include "nlohmann/json.hpp"

namespace api {
// Renders events as JSON, logs them when event logging is enabled and
// buffers them until the host fetches them with take().
class JsonEventSink : public ledger::EventSink {
public:
    void on_event(const fungible::Event&) override;
    void on_event(const unique::Event&) override;
    [[nodiscard]] nlohmann::json take();

private:
    void push(nlohmann::json);
    nlohmann::json pending = nlohmann::json::array();
};
}
