#include <libstealthpool/stealth/StealthAddress.h>

#include <libstealthpool/crypto/Digest.h>
#include <libstealthpool/crypto/Random.h>
#include <libstealthpool/stealth/StealthError.h>

#include <array>
#include <cstring>

namespace stealthpool {

namespace {

// Holds a shared secret and wipes it when done.
class ScopedSecret
{
public:
    ScopedSecret(SecretKey const& priv, PublicKey const& pub)
        : value_(ecdh(priv, pub))
    {
    }

    ScopedSecret(ScopedSecret const&) = delete;
    ScopedSecret&
    operator=(ScopedSecret const&) = delete;

    ~ScopedSecret()
    {
        secureErase(value_.data(), value_.size());
    }

    SharedSecret const&
    get() const
    {
        return value_;
    }

private:
    SharedSecret value_;
};

PublicKey
parsePublic(Blob const& bytes, char const* what)
{
    auto const pub = PublicKey::fromBytes(bytes);
    if (!pub)
        throw StealthError(
            StealthError::Code::InvalidKey,
            std::string(what) + " is not a valid compressed public key");
    return *pub;
}

SecretKey
parseSecret(Blob const& bytes, char const* what)
{
    auto const key = SecretKey::fromBytes(bytes.data(), bytes.size());
    if (!key)
        throw StealthError(
            StealthError::Code::InvalidKey,
            std::string(what) + " is not a valid scalar");
    return *key;
}

}  // namespace

uint256
stealthTweak(SharedSecret const& shared, std::uint32_t k)
{
    std::array<std::uint8_t, 33 + 4> buf;
    std::memcpy(buf.data(), shared.data(), shared.size());
    buf[33] = static_cast<std::uint8_t>(k >> 24);
    buf[34] = static_cast<std::uint8_t>(k >> 16);
    buf[35] = static_cast<std::uint8_t>(k >> 8);
    buf[36] = static_cast<std::uint8_t>(k);
    auto const digest = sha256(buf.data(), buf.size());
    secureErase(buf.data(), buf.size());
    return reduceModOrder(digest);
}

AccountID
stealthAddressFromPublicKey(PublicKey const& pub)
{
    auto const full = pub.uncompressed();
    auto const digest = sha3_256(full.data() + 1, full.size() - 1);
    return AccountID::fromBytes(
        digest.data() + (uint256::size() - AccountID::size()), AccountID::size());
}

StealthPayment
deriveStealthAddress(
    MetaAddress const& meta,
    SecretKey const& ephemeralPrivateKey,
    std::uint32_t k)
{
    ScopedSecret const shared(ephemeralPrivateKey, meta.viewingPublicKey);
    auto const tweak = stealthTweak(shared.get(), k);

    auto const stealthPub = tweakAdd(meta.spendPublicKey, tweak);
    if (!stealthPub)
        throw StealthError(
            StealthError::Code::InvalidKey, "derived stealth key is degenerate");

    return {
        stealthAddressFromPublicKey(*stealthPub),
        *stealthPub,
        ephemeralPrivateKey.publicKey(),
        shared.get()[0],
        k};
}

StealthPayment
deriveStealthAddress(MetaAddress const& meta, std::uint32_t k)
{
    try
    {
        return deriveStealthAddress(meta, SecretKey::random(), k);
    }
    catch (RandomnessUnavailable const& e)
    {
        throw StealthError(StealthError::Code::RandomnessUnavailable, e.what());
    }
}

StealthPayment
deriveStealthAddress(
    Blob const& spendPublicKey,
    Blob const& viewingPublicKey,
    Blob const& ephemeralPrivateKey,
    std::uint32_t k)
{
    MetaAddress const meta{
        parsePublic(spendPublicKey, "spend public key"),
        parsePublic(viewingPublicKey, "viewing public key")};
    return deriveStealthAddress(
        meta, parseSecret(ephemeralPrivateKey, "ephemeral private key"), k);
}

SecretKey
recoverStealthPrivateKey(
    SecretKey const& viewingPrivateKey,
    SecretKey const& spendPrivateKey,
    PublicKey const& ephemeralPublicKey,
    std::uint32_t k)
{
    ScopedSecret const shared(viewingPrivateKey, ephemeralPublicKey);
    auto const key = tweakAdd(spendPrivateKey, stealthTweak(shared.get(), k));
    if (!key)
        throw StealthError(
            StealthError::Code::InvalidKey, "recovered stealth key is zero");
    return *key;
}

SecretKey
recoverStealthPrivateKey(
    Blob const& viewingPrivateKey,
    Blob const& spendPrivateKey,
    Blob const& ephemeralPublicKey,
    std::uint32_t k)
{
    return recoverStealthPrivateKey(
        parseSecret(viewingPrivateKey, "viewing private key"),
        parseSecret(spendPrivateKey, "spend private key"),
        parsePublic(ephemeralPublicKey, "ephemeral public key"),
        k);
}

KeyValidation
validatePublicKey(Blob const& bytes)
{
    if (bytes.size() != PublicKey::compressedSize)
        return {false, "expected 33 bytes"};
    if (bytes[0] != 0x02 && bytes[0] != 0x03)
        return {false, "prefix must be 0x02 or 0x03"};
    if (!PublicKey::fromBytes(bytes))
        return {false, "not a point on secp256k1"};
    return {true, {}};
}

bool
checkViewHint(
    SecretKey const& viewingPrivateKey,
    PublicKey const& ephemeralPublicKey,
    std::uint8_t viewHint)
{
    ScopedSecret const shared(viewingPrivateKey, ephemeralPublicKey);
    return shared.get()[0] == viewHint;
}

bool
matchesStealthAddress(
    SecretKey const& viewingPrivateKey,
    PublicKey const& spendPublicKey,
    PublicKey const& ephemeralPublicKey,
    std::uint32_t k,
    AccountID const& stealthAddress)
{
    ScopedSecret const shared(viewingPrivateKey, ephemeralPublicKey);
    auto const stealthPub =
        tweakAdd(spendPublicKey, stealthTweak(shared.get(), k));
    return stealthPub && stealthAddressFromPublicKey(*stealthPub) == stealthAddress;
}

}  // namespace stealthpool
