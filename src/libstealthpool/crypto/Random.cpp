#include <libstealthpool/crypto/Random.h>

#include <openssl/rand.h>

#include <limits>

namespace stealthpool {

void
randomBytes(std::uint8_t* out, std::size_t size)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        throw std::invalid_argument("randomBytes: request too large");
    if (RAND_bytes(out, static_cast<int>(size)) != 1)
        throw RandomnessUnavailable("system random source unavailable");
}

}  // namespace stealthpool
