#include "id_allocator.hpp"
#include "spdlog/spdlog.h"

namespace ledger {
AssetId SaturatingIdAllocator::next_id()
{
    auto id { peek() };
    if (id == AssetId::max()) {
        spdlog::warn("Asset id space is saturated, handing out id {} again", id.to_string());
        return id;
    }
    nonce.set(AssetId { id.value() + 1 });
    return id;
}

Result<AssetId> CheckedIdAllocator::next_id()
{
    auto id { peek() };
    if (id == AssetId::max())
        return Error(ETYPEOVERFLOW);
    nonce.set(AssetId { id.value() + 1 });
    return id;
}
}
