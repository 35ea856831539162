#ifndef STEALTHPOOL_BASICS_ACCOUNTID_H_INCLUDED
#define STEALTHPOOL_BASICS_ACCOUNTID_H_INCLUDED

#include <libstealthpool/basics/base_uint.h>

#include <string>

namespace stealthpool {

/** A 20 byte chain account address. */
using AccountID = uint160;

inline std::string
toHexAddress(AccountID const& id)
{
    return "0x" + to_string(id);
}

}  // namespace stealthpool

#endif
