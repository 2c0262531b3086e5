#pragma once
#include "ledger/events.hpp"

namespace ledger {
// Receives the events of committed commands in emission order.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const fungible::Event&) = 0;
    virtual void on_event(const unique::Event&) = 0;
};
}
