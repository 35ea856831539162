#ifndef STEALTHPOOL_BASICS_TER_H_INCLUDED
#define STEALTHPOOL_BASICS_TER_H_INCLUDED

#include <ostream>
#include <string>

namespace stealthpool {

/** Result of applying a pool operation.

    tes codes mean the state transition was committed. tec codes mean the
    operation was rejected and nothing was applied.
*/
enum TER : int {
    tesSUCCESS = 0,

    tecINVALID_FIELD_ELEMENT = 100,
    tecTREE_FULL = 101,
    tecUNKNOWN_ROOT = 102,
    tecNULLIFIER_ALREADY_USED = 103,
    tecINVALID_PROOF = 104,
    tecINVALID_RELAYER_FEE = 105,
    tecPOOL_MODE_DISABLED = 106,
    tecDISPATCH_FAILED = 107,
    tecREENTRANT_CALL = 108,
    tecINSUFFICIENT_FUNDS = 109,
    tecINVALID_EPHEMERAL_KEY = 110,
};

inline bool
isTesSuccess(TER x)
{
    return x == tesSUCCESS;
}

inline bool
isTecClaim(TER x)
{
    return x >= tecINVALID_FIELD_ELEMENT;
}

/** Stable short name for a result, e.g. "UnknownRoot". */
std::string
transToken(TER code);

/** Human readable description of a result. */
std::string
transHuman(TER code);

inline std::ostream&
operator<<(std::ostream& os, TER code)
{
    return os << transToken(code);
}

}  // namespace stealthpool

#endif
