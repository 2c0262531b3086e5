#pragma once
#include "general/result.hpp"
#include "ledger/asset.hpp"
#include <optional>

namespace ledger {
// gate for privileged fungible operations
[[nodiscard]] inline Result<void> ensure_is_owner(const std::optional<AssetDetails>& details, const AccountId& caller)
{
    if (!details)
        return Error(EUNKNOWN);
    if (details->owner != caller)
        return Error(ENOPERMISSION);
    return {};
}
}
