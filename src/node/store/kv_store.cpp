#include "kv_store.hpp"
#include <stdexcept>

namespace store {
StoreTransaction KVStore::transaction()
{
    if (transactionOpen)
        throw std::logic_error("Nested store transactions are not supported");
    begin();
    transactionOpen = true;
    return { *this };
}

void StoreTransaction::commit()
{
    if (parent == nullptr)
        throw std::logic_error("Store transaction already finished");
    parent->commit();
    parent->transactionOpen = false;
    parent = nullptr;
}

StoreTransaction::~StoreTransaction()
{
    if (parent != nullptr) {
        parent->rollback();
        parent->transactionOpen = false;
    }
}
}
