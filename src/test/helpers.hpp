#pragma once
#include "ledger/event_sink.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

// collects events in emission order
struct RecordingEventSink : public ledger::EventSink {
    std::vector<fungible::Event> fungibleEvents;
    std::vector<unique::Event> uniqueEvents;
    void on_event(const fungible::Event& e) override
    {
        fungibleEvents.push_back(e);
    }
    void on_event(const unique::Event& e) override
    {
        uniqueEvents.push_back(e);
    }
    size_t size() const { return fungibleEvents.size() + uniqueEvents.size(); }
};

template <typename E>
const E& last_event(const std::vector<fungible::Event>& events)
{
    assert(!events.empty());
    assert(std::holds_alternative<E>(events.back()));
    return std::get<E>(events.back());
}

template <typename E>
const E& last_event(const std::vector<unique::Event>& events)
{
    assert(!events.empty());
    assert(std::holds_alternative<E>(events.back()));
    return std::get<E>(events.back());
}

// removes the database file on scope exit
struct TempDBPath {
    std::string path;
    TempDBPath(std::string name)
        : path((std::filesystem::temp_directory_path() / (name + "_" + std::to_string(getpid()) + ".db3")).string())
    {
        std::filesystem::remove(path);
    }
    ~TempDBPath()
    {
        std::filesystem::remove(path);
    }
};

inline const AccountId alice { "alice" };
inline const AccountId bob { "bob" };
inline const AccountId carol { "carol" };
inline const AccountId dave { "dave" };
