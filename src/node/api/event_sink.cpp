#include "event_sink.hpp"
#include "api/json.hpp"
#include "general/logging.hpp"
#include <utility>

namespace api {
void JsonEventSink::on_event(const fungible::Event& e)
{
    push(jsonmsg::to_json(e));
}

void JsonEventSink::on_event(const unique::Event& e)
{
    push(jsonmsg::to_json(e));
}

nlohmann::json JsonEventSink::take()
{
    return std::exchange(pending, nlohmann::json::array());
}

void JsonEventSink::push(nlohmann::json j)
{
    log_events("Event {}", j.dump());
    pending.push_back(std::move(j));
}
}
