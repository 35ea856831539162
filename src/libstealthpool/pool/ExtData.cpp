#include <libstealthpool/pool/ExtData.h>

#include <libstealthpool/crypto/Digest.h>
#include <libstealthpool/zkp/Field.h>

namespace stealthpool {

namespace {

template <class Container>
void
append(Blob& out, Container const& c)
{
    out.insert(out.end(), c.begin(), c.end());
}

struct TokenPacker
{
    Blob& out;

    void
    operator()(GmpToken const& t) const
    {
        append(out, t.symbol);
    }

    void
    operator()(ItsToken const& t) const
    {
        append(out, t.tokenId);
    }
};

}  // namespace

Blob
packExtData(
    WithdrawRequest const& request,
    uint256 const& amountToBridge,
    AccountID const& bridgeAddress,
    TokenIdentifier const& token)
{
    Blob out;
    out.reserve(
        request.destinationChain.size() + 20 +
        request.ephemeralPublicKey.size() + 1 + 4 + 32 + 32 + 20 + 32);

    append(out, request.destinationChain);
    append(out, request.stealthAddress);
    append(out, request.ephemeralPublicKey);
    out.push_back(request.viewHint);
    for (int shift = 24; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>(request.k >> shift));
    append(out, amountToBridge);
    append(out, request.relayerFee);
    append(out, bridgeAddress);
    std::visit(TokenPacker{out}, token);
    return out;
}

uint256
computeExtDataHash(
    WithdrawRequest const& request,
    uint256 const& amountToBridge,
    AccountID const& bridgeAddress,
    TokenIdentifier const& token)
{
    return zkp::reduceToField(
        sha3_256(packExtData(request, amountToBridge, bridgeAddress, token)));
}

}  // namespace stealthpool
