#ifndef STEALTHPOOL_BASICS_STRHEX_H_INCLUDED
#define STEALTHPOOL_BASICS_STRHEX_H_INCLUDED

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace stealthpool {

using Blob = std::vector<std::uint8_t>;

template <class FwdIt>
std::string
strHex(FwdIt begin, FwdIt end)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(2 * std::distance(begin, end));
    for (auto it = begin; it != end; ++it)
    {
        auto const b = static_cast<std::uint8_t>(*it);
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0f]);
    }
    return result;
}

template <class Container>
std::string
strHex(Container const& c)
{
    return strHex(c.begin(), c.end());
}

/** Decode hex, accepting an optional 0x prefix. Empty on malformed input. */
std::optional<Blob>
strUnHex(std::string const& hex);

}  // namespace stealthpool

#endif
