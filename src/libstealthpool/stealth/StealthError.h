#ifndef STEALTHPOOL_STEALTH_STEALTHERROR_H_INCLUDED
#define STEALTHPOOL_STEALTH_STEALTHERROR_H_INCLUDED

#include <stdexcept>
#include <string>

namespace stealthpool {

/** Failure of an off-chain stealth address operation.

    The reason names what was wrong ("ephemeral public key is off curve"),
    never the bytes involved.
*/
class StealthError : public std::runtime_error
{
public:
    enum class Code { InvalidKey, RandomnessUnavailable };

    StealthError(Code code, std::string const& reason)
        : std::runtime_error(reason), code_(code)
    {
    }

    Code
    code() const
    {
        return code_;
    }

private:
    Code code_;
};

inline char const*
to_string(StealthError::Code code)
{
    switch (code)
    {
        case StealthError::Code::InvalidKey:
            return "InvalidKey";
        case StealthError::Code::RandomnessUnavailable:
            return "RandomnessUnavailable";
    }
    return "Unknown";
}

}  // namespace stealthpool

#endif
