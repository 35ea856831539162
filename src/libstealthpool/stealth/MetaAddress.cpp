#include <libstealthpool/stealth/MetaAddress.h>

#include <libstealthpool/basics/strHex.h>
#include <libstealthpool/crypto/Random.h>
#include <libstealthpool/stealth/StealthError.h>

#include <stdexcept>

namespace stealthpool {

char const* const metaAddressPrefix = "stmeta:";

namespace {

SecretKey
drawKey()
{
    try
    {
        return SecretKey::random();
    }
    catch (RandomnessUnavailable const& e)
    {
        throw StealthError(StealthError::Code::RandomnessUnavailable, e.what());
    }
}

}  // namespace

MetaKeys
generateMetaAddress()
{
    auto spend = drawKey();
    auto viewing = drawKey();
    MetaAddress meta{spend.publicKey(), viewing.publicKey()};
    return {meta, spend, viewing};
}

std::string
encodeMetaAddress(MetaAddress const& meta)
{
    return std::string(metaAddressPrefix) + strHex(meta.spendPublicKey.bytes()) +
        strHex(meta.viewingPublicKey.bytes());
}

MetaAddress
decodeMetaAddress(std::string const& text)
{
    std::string const prefix(metaAddressPrefix);
    if (text.compare(0, prefix.size(), prefix) != 0)
        throw std::invalid_argument("meta-address: missing 'stmeta:' prefix");

    auto const raw = strUnHex(text.substr(prefix.size()));
    if (!raw || raw->size() != 2 * PublicKey::compressedSize)
        throw std::invalid_argument(
            "meta-address: expected 132 hex characters after the prefix");

    auto const spend = PublicKey::fromBytes(raw->data(), PublicKey::compressedSize);
    if (!spend)
        throw StealthError(
            StealthError::Code::InvalidKey,
            "meta-address: spend public key is not a valid point");

    auto const viewing = PublicKey::fromBytes(
        raw->data() + PublicKey::compressedSize, PublicKey::compressedSize);
    if (!viewing)
        throw StealthError(
            StealthError::Code::InvalidKey,
            "meta-address: viewing public key is not a valid point");

    return {*spend, *viewing};
}

}  // namespace stealthpool
