#ifndef STEALTHPOOL_BASICS_CONFIG_H_INCLUDED
#define STEALTHPOOL_BASICS_CONFIG_H_INCLUDED

#include <libstealthpool/basics/Log.h>
#include <libstealthpool/basics/Retry.h>

#include <boost/property_tree/ptree.hpp>

#include <istream>
#include <stdexcept>
#include <string>

namespace stealthpool {

/** Read an INI file into a property tree. Throws std::invalid_argument. */
boost::property_tree::ptree
loadConfigFile(std::string const& path);

boost::property_tree::ptree
loadConfig(std::istream& in);

/** Value at key, or fallback when absent.
    @throws std::invalid_argument when present but not convertible to T
*/
template <class T>
T
getConfigValue(
    boost::property_tree::ptree const& tree,
    std::string const& key,
    T const& fallback)
{
    if (!tree.get_optional<std::string>(key))
        return fallback;
    auto const v = tree.get_optional<T>(key);
    if (!v)
        throw std::invalid_argument("bad value for config key '" + key + "'");
    return *v;
}

/** [logging] severity, file */
LogConfig
parseLogConfig(boost::property_tree::ptree const& pt);

/** [retry] max_attempts, base_delay_ms, max_delay_ms */
RetryPolicy
parseRetryPolicy(boost::property_tree::ptree const& pt);

/** [zkp] key_path */
std::string
parseKeyPath(boost::property_tree::ptree const& pt);

}  // namespace stealthpool

#endif
