#ifndef STEALTHPOOL_POOL_POOLCONFIG_H_INCLUDED
#define STEALTHPOOL_POOL_POOLCONFIG_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/Config.h>
#include <libstealthpool/pool/ExtData.h>

#include <boost/property_tree/ptree.hpp>

#include <cstddef>
#include <string>

namespace stealthpool {

/** Fixed parameters of one pool. */
struct PoolParams
{
    AccountID poolAddress;
    uint256 denomination;
    std::size_t levels = 20;
    TokenIdentifier token = GmpToken{};
};

/** Everything a pool node reads from its INI file. */
struct PoolConfig
{
    PoolParams pool;
    std::string keyPath;
    LogConfig log;
    RetryPolicy retry;
};

/** [pool] section: pool_address, denomination, levels, mode, token_symbol,
    token_id. mode is "gmp" (needs token_symbol) or "its" (needs token_id).

    @throws std::invalid_argument on missing or malformed values
*/
PoolParams
parsePoolParams(boost::property_tree::ptree const& tree);

PoolConfig
parsePoolConfig(boost::property_tree::ptree const& tree);

}  // namespace stealthpool

#endif
