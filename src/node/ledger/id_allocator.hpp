#pragma once
#include "general/result.hpp"
#include "ledger/asset_id.hpp"
#include "store/tables.hpp"

namespace ledger {

// Hands out asset ids from the registry's persisted nonce. The nonce
// starts at zero and is only advanced here.
class IdAllocatorBase {
public:
    IdAllocatorBase(store::KVStore& kv, std::string prefix)
        : nonce(kv, std::move(prefix))
    {
    }
    // the id the next allocation returns
    [[nodiscard]] AssetId peek() const
    {
        return nonce.get().value_or(AssetId { 0 });
    }

protected:
    store::StorageValue<AssetId> nonce;
};

// Never fails. Once the nonce reached AssetId::max() every further
// allocation returns AssetId::max() again.
class SaturatingIdAllocator : public IdAllocatorBase {
public:
    using IdAllocatorBase::IdAllocatorBase;
    AssetId next_id();
};

// Fails with ETYPEOVERFLOW when the nonce cannot be advanced, in that
// case nothing is written and no id is consumed.
class CheckedIdAllocator : public IdAllocatorBase {
public:
    using IdAllocatorBase::IdAllocatorBase;
    [[nodiscard]] Result<AssetId> next_id();
};
}
