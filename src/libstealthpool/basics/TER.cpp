#include <libstealthpool/basics/TER.h>

#include <unordered_map>
#include <utility>

namespace stealthpool {

namespace {

std::unordered_map<int, std::pair<char const*, char const*>> const&
transResults()
{
    static std::unordered_map<int, std::pair<char const*, char const*>> const
        results{
            {tesSUCCESS, {"tesSUCCESS", "The operation was applied."}},
            {tecINVALID_FIELD_ELEMENT,
             {"InvalidFieldElement",
              "A public value is not below the scalar field modulus."}},
            {tecTREE_FULL,
             {"TreeFull", "The commitment tree has no free leaves."}},
            {tecUNKNOWN_ROOT,
             {"UnknownRoot", "The root is not in the recent root history."}},
            {tecNULLIFIER_ALREADY_USED,
             {"NullifierAlreadyUsed", "The note has already been spent."}},
            {tecINVALID_PROOF,
             {"InvalidProof", "The withdrawal proof did not verify."}},
            {tecINVALID_RELAYER_FEE,
             {"InvalidRelayerFee",
              "The relayer fee exceeds the pool denomination."}},
            {tecPOOL_MODE_DISABLED,
             {"PoolNotConfiguredForMode",
              "The pool is not configured for this withdrawal mode."}},
            {tecDISPATCH_FAILED,
             {"DispatchFailed", "The bridge dispatcher rejected the payout."}},
            {tecREENTRANT_CALL,
             {"ReentrantCall", "Nested call into the pool was refused."}},
            {tecINSUFFICIENT_FUNDS,
             {"InsufficientFunds",
              "The depositor could not fund the denomination."}},
            {tecINVALID_EPHEMERAL_KEY,
             {"InvalidEphemeralKey",
              "The ephemeral public key is not a compressed secp256k1 point."}},
        };
    return results;
}

}  // namespace

std::string
transToken(TER code)
{
    auto const& results = transResults();
    auto const it = results.find(code);
    if (it == results.end())
        return "Unknown";
    return it->second.first;
}

std::string
transHuman(TER code)
{
    auto const& results = transResults();
    auto const it = results.find(code);
    if (it == results.end())
        return "Unknown result code.";
    return it->second.second;
}

}  // namespace stealthpool
