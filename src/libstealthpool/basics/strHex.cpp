#include <libstealthpool/basics/strHex.h>

namespace stealthpool {

static int
hexDigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<Blob>
strUnHex(std::string const& hex)
{
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        start = 2;

    if ((hex.size() - start) % 2 != 0)
        return std::nullopt;

    Blob out;
    out.reserve((hex.size() - start) / 2);
    for (std::size_t i = start; i < hex.size(); i += 2)
    {
        int const hi = hexDigit(hex[i]);
        int const lo = hexDigit(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace stealthpool
