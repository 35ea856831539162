#include <libstealthpool/crypto/Secp256k1.h>

#include <libstealthpool/crypto/Digest.h>
#include <libstealthpool/crypto/Random.h>

#include <secp256k1.h>
#include <secp256k1_ecdh.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace stealthpool {

namespace {

struct ContextDeleter
{
    void
    operator()(secp256k1_context* ctx) const
    {
        secp256k1_context_destroy(ctx);
    }
};

// Copies the compressed shared point instead of hashing it.
int
compressedPointHash(
    unsigned char* output,
    unsigned char const* x32,
    unsigned char const* y32,
    void*)
{
    output[0] = 0x02 | (y32[31] & 1);
    std::memcpy(output + 1, x32, 32);
    return 1;
}

secp256k1_pubkey
parseOrThrow(PublicKey const& pub)
{
    secp256k1_pubkey parsed;
    if (secp256k1_ec_pubkey_parse(
            secp256k1Context(), &parsed, pub.data(), pub.size()) != 1)
        throw std::logic_error("secp256k1: stored public key failed to parse");
    return parsed;
}

PublicKey::Bytes
serializeCompressed(secp256k1_pubkey const& key)
{
    PublicKey::Bytes out;
    std::size_t len = out.size();
    secp256k1_ec_pubkey_serialize(
        secp256k1Context(), out.data(), &len, &key, SECP256K1_EC_COMPRESSED);
    return out;
}

}  // namespace

secp256k1_context const*
secp256k1Context()
{
    static std::unique_ptr<secp256k1_context, ContextDeleter> const context =
        [] {
            std::unique_ptr<secp256k1_context, ContextDeleter> ctx(
                secp256k1_context_create(
                    SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY));
            std::array<std::uint8_t, 32> seed;
            randomBytes(seed.data(), seed.size());
            if (secp256k1_context_randomize(ctx.get(), seed.data()) != 1)
                throw std::runtime_error("secp256k1: context randomize failed");
            secureErase(seed.data(), seed.size());
            return ctx;
        }();
    return context.get();
}

std::optional<PublicKey>
PublicKey::fromBytes(std::uint8_t const* data, std::size_t size)
{
    if (size != compressedSize || (data[0] != 0x02 && data[0] != 0x03))
        return std::nullopt;

    secp256k1_pubkey parsed;
    if (secp256k1_ec_pubkey_parse(secp256k1Context(), &parsed, data, size) != 1)
        return std::nullopt;

    return PublicKey(serializeCompressed(parsed));
}

std::array<std::uint8_t, 65>
PublicKey::uncompressed() const
{
    auto const parsed = parseOrThrow(*this);
    std::array<std::uint8_t, 65> out;
    std::size_t len = out.size();
    secp256k1_ec_pubkey_serialize(
        secp256k1Context(),
        out.data(),
        &len,
        &parsed,
        SECP256K1_EC_UNCOMPRESSED);
    return out;
}

SecretKey
SecretKey::random()
{
    SecretKey key;
    // The chance of drawing an invalid scalar is about 2^-128.
    do
    {
        randomBytes(key.buf_.data(), key.buf_.size());
    } while (secp256k1_ec_seckey_verify(secp256k1Context(), key.buf_.data()) !=
             1);
    return key;
}

std::optional<SecretKey>
SecretKey::fromBytes(std::uint8_t const* data, std::size_t size)
{
    if (size != 32 || secp256k1_ec_seckey_verify(secp256k1Context(), data) != 1)
        return std::nullopt;
    SecretKey key;
    std::memcpy(key.buf_.data(), data, 32);
    return key;
}

SecretKey::~SecretKey()
{
    secureErase(buf_.data(), buf_.size());
}

PublicKey
SecretKey::publicKey() const
{
    secp256k1_pubkey pub;
    if (secp256k1_ec_pubkey_create(secp256k1Context(), &pub, buf_.data()) != 1)
        throw std::logic_error("secp256k1: valid secret key rejected");
    return PublicKey(serializeCompressed(pub));
}

SharedSecret
ecdh(SecretKey const& priv, PublicKey const& pub)
{
    auto const point = parseOrThrow(pub);
    SharedSecret out;
    if (secp256k1_ecdh(
            secp256k1Context(),
            out.data(),
            &point,
            priv.data(),
            compressedPointHash,
            nullptr) != 1)
        throw std::logic_error("secp256k1: ecdh failed on valid inputs");
    return out;
}

std::optional<PublicKey>
tweakAdd(PublicKey const& pub, uint256 const& tweak)
{
    auto point = parseOrThrow(pub);
    if (secp256k1_ec_pubkey_tweak_add(secp256k1Context(), &point, tweak.data()) !=
        1)
        return std::nullopt;
    return PublicKey(serializeCompressed(point));
}

std::optional<SecretKey>
tweakAdd(SecretKey const& priv, uint256 const& tweak)
{
    SecretKey out = priv;
    if (secp256k1_ec_seckey_tweak_add(
            secp256k1Context(), out.buf_.data(), tweak.data()) != 1)
        return std::nullopt;
    return out;
}

uint256 const&
curveOrder()
{
    static uint256 const n = uint256::fromHex(
        "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");
    return n;
}

uint256
reduceModOrder(uint256 const& v)
{
    if (v >= curveOrder())
        return v - curveOrder();
    return v;
}

}  // namespace stealthpool
