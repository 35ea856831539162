#ifndef STEALTHPOOL_CRYPTO_DIGEST_H_INCLUDED
#define STEALTHPOOL_CRYPTO_DIGEST_H_INCLUDED

#include <libstealthpool/basics/base_uint.h>

#include <cstddef>
#include <cstdint>

namespace stealthpool {

uint256
sha256(std::uint8_t const* data, std::size_t size);

inline uint256
sha256(Blob const& data)
{
    return sha256(data.data(), data.size());
}

/** The chain address digest. */
uint256
sha3_256(std::uint8_t const* data, std::size_t size);

inline uint256
sha3_256(Blob const& data)
{
    return sha3_256(data.data(), data.size());
}

/** Zero memory that held secret material. */
void
secureErase(void* p, std::size_t size);

}  // namespace stealthpool

#endif
