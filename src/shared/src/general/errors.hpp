#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// These codes describe why a ledger command was rejected
// or why stored or user supplied data could not be used.

// Ledger command errors, range [1-99]:
// Host and storage errors, range [100-199]
#define ADDITIONAL_ERRNO_MAP(XX)                                   \
    XX(0, ENOERROR, "no error")                                    \
    XX(1, EUNKNOWN, "asset id unknown")                            \
    XX(2, ENOPERMISSION, "signing account is not the asset owner") \
    XX(3, ENOTOWNED, "signing account does not own this asset")    \
    XX(4, ENOSUPPLY, "supply must be positive")                    \
    XX(5, ETYPEOVERFLOW, "asset id space exhausted")               \
    XX(56, ENOTFOUND, "not found")                                 \
    XX(100, ECORRUPTED, "corrupted stored value")                  \
    XX(101, EEXCESSBYTES, "excessive bytes after parsing")         \
    XX(102, EINV_ARGS, "invalid command arguments")                \
    XX(103, EINV_NUMBER, "invalid number")                         \
    XX(104, EINV_HEX, "invalid hex string")                        \
    XX(105, EUNKNOWNCMD, "unknown command")                        \
    XX(106, ENOCALLER, "command requires a caller")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ADDITIONAL_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
