#ifndef STEALTHPOOL_CRYPTO_RANDOM_H_INCLUDED
#define STEALTHPOOL_CRYPTO_RANDOM_H_INCLUDED

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace stealthpool {

class RandomnessUnavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** Fill with bytes from the system CSPRNG. Throws RandomnessUnavailable. */
void
randomBytes(std::uint8_t* out, std::size_t size);

}  // namespace stealthpool

#endif
