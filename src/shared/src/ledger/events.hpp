#pragma once
#include "ledger/asset.hpp"
#include <variant>

// Notifications of completed state transitions. Every event is emitted
// after its command was committed.

namespace fungible {
namespace event {
    struct Created {
        static constexpr const char* event_name { "Created" };
        AccountId owner;
        AssetId asset_id;
    };
    struct MetadataSet {
        static constexpr const char* event_name { "MetadataSet" };
        AssetId asset_id;
        Bytes name;
        Bytes symbol;
    };
    struct Minted {
        static constexpr const char* event_name { "Minted" };
        AssetId asset_id;
        AccountId owner;
        Funds_uint128 total_supply;
    };
    struct Burned {
        static constexpr const char* event_name { "Burned" };
        AssetId asset_id;
        AccountId owner;
        Funds_uint128 total_supply;
    };
    struct Transferred {
        static constexpr const char* event_name { "Transferred" };
        AssetId asset_id;
        AccountId from;
        AccountId to;
        Funds_uint128 amount; // amount actually moved
    };
}
using Event = std::variant<event::Created, event::MetadataSet, event::Minted, event::Burned, event::Transferred>;
}

namespace unique {
namespace event {
    struct Created {
        static constexpr const char* event_name { "Created" };
        AccountId creator;
        AssetId asset_id;
    };
    struct Burned {
        static constexpr const char* event_name { "Burned" };
        AssetId asset_id;
        AccountId owner;
        Funds_uint128 total_supply;
    };
    struct Transferred {
        static constexpr const char* event_name { "Transferred" };
        AssetId asset_id;
        AccountId from;
        AccountId to;
        Funds_uint128 amount;
    };
}
using Event = std::variant<event::Created, event::Burned, event::Transferred>;
}
