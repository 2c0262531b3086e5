#pragma once
#include "general/funds.hpp"
#include "ledger/account_id.hpp"
#include "ledger/asset_id.hpp"

namespace ledger {

// Capability handed to marketplace style modules so they can move
// resources between accounts without depending on a concrete registry.
class Sellable {
public:
    virtual ~Sellable() = default;
    [[nodiscard]] virtual Funds_uint128 amount_owned(AssetId, const AccountId&) const = 0;

    // Moves at most amount and returns the amount actually moved,
    // never fails.
    virtual Funds_uint128 transfer(AssetId, const AccountId& from, const AccountId& to, Funds_uint128 amount) = 0;
};
}
