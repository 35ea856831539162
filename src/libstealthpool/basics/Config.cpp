#include <libstealthpool/basics/Config.h>

#include <boost/property_tree/ini_parser.hpp>

#include <stdexcept>

namespace stealthpool {

namespace pt = boost::property_tree;

pt::ptree
loadConfigFile(std::string const& path)
{
    pt::ptree tree;
    try
    {
        pt::read_ini(path, tree);
    }
    catch (pt::ini_parser_error const& e)
    {
        throw std::invalid_argument(
            "unable to read config '" + path + "': " + e.message());
    }
    return tree;
}

pt::ptree
loadConfig(std::istream& in)
{
    pt::ptree tree;
    try
    {
        pt::read_ini(in, tree);
    }
    catch (pt::ini_parser_error const& e)
    {
        throw std::invalid_argument("malformed config: " + e.message());
    }
    return tree;
}

LogConfig
parseLogConfig(pt::ptree const& tree)
{
    LogConfig config;
    config.severity =
        severityFromString(getConfigValue<std::string>(tree, "logging.severity", "info"));
    config.file = getConfigValue<std::string>(tree, "logging.file", "");
    config.console = getConfigValue<bool>(tree, "logging.console", true);
    return config;
}

RetryPolicy
parseRetryPolicy(pt::ptree const& tree)
{
    RetryPolicy policy;
    auto const attempts = getConfigValue<int>(tree, "retry.max_attempts", 4);
    auto const base = getConfigValue<int>(tree, "retry.base_delay_ms", 250);
    auto const cap = getConfigValue<int>(tree, "retry.max_delay_ms", 4000);
    if (attempts < 1 || attempts > 16)
        throw std::invalid_argument("retry.max_attempts must be in [1, 16]");
    if (base < 0 || cap < base)
        throw std::invalid_argument(
            "retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
    policy.maxAttempts = static_cast<unsigned>(attempts);
    policy.baseDelay = std::chrono::milliseconds(base);
    policy.maxDelay = std::chrono::milliseconds(cap);
    return policy;
}

std::string
parseKeyPath(pt::ptree const& tree)
{
    return getConfigValue<std::string>(tree, "zkp.key_path", "stealthpool_withdraw");
}

}  // namespace stealthpool
