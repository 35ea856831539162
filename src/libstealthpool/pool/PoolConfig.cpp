#include <libstealthpool/pool/PoolConfig.h>

#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MerkleTreeWithHistory.h>

#include <stdexcept>

namespace stealthpool {

namespace pt = boost::property_tree;

namespace {

std::string
required(pt::ptree const& tree, std::string const& key)
{
    auto const v = tree.get_optional<std::string>(key);
    if (!v || v->empty())
        throw std::invalid_argument("missing config key '" + key + "'");
    return *v;
}

}  // namespace

PoolParams
parsePoolParams(pt::ptree const& tree)
{
    PoolParams params;

    params.poolAddress = AccountID::fromHex(required(tree, "pool.pool_address"));

    params.denomination = zkp::uintFromDecimal(required(tree, "pool.denomination"));
    if (params.denomination.isZero())
        throw std::invalid_argument("pool.denomination must be positive");

    int const levels = getConfigValue<int>(
        tree,
        "pool.levels",
        static_cast<int>(zkp::MerkleTreeWithHistory::DEFAULT_LEVELS));
    if (levels < 1 ||
        levels > static_cast<int>(zkp::MerkleTreeWithHistory::MAX_LEVELS))
        throw std::invalid_argument("pool.levels must be in [1, 32]");
    params.levels = static_cast<std::size_t>(levels);

    auto const mode = tree.get<std::string>("pool.mode", "gmp");
    if (mode == "gmp")
    {
        params.token = GmpToken{required(tree, "pool.token_symbol")};
    }
    else if (mode == "its")
    {
        params.token = ItsToken{uint256::fromHex(required(tree, "pool.token_id"))};
    }
    else
    {
        throw std::invalid_argument(
            "pool.mode must be 'gmp' or 'its', got '" + mode + "'");
    }

    return params;
}

PoolConfig
parsePoolConfig(pt::ptree const& tree)
{
    PoolConfig config;
    config.pool = parsePoolParams(tree);
    config.keyPath = parseKeyPath(tree);
    config.log = parseLogConfig(tree);
    config.retry = parseRetryPolicy(tree);
    return config;
}

}  // namespace stealthpool
