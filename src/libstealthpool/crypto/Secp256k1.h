#ifndef STEALTHPOOL_CRYPTO_SECP256K1_H_INCLUDED
#define STEALTHPOOL_CRYPTO_SECP256K1_H_INCLUDED

#include <libstealthpool/basics/base_uint.h>

#include <array>
#include <cstdint>
#include <optional>

struct secp256k1_context_struct;

namespace stealthpool {

secp256k1_context_struct const*
secp256k1Context();

/** A compressed secp256k1 point (33 bytes, 0x02/0x03 prefix).

    Instances only exist for points that parsed successfully.
*/
class PublicKey
{
public:
    static constexpr std::size_t compressedSize = 33;
    using Bytes = std::array<std::uint8_t, compressedSize>;

    /** Parse a compressed encoding. Empty when malformed or off curve. */
    static std::optional<PublicKey>
    fromBytes(std::uint8_t const* data, std::size_t size);

    static std::optional<PublicKey>
    fromBytes(Blob const& b)
    {
        return fromBytes(b.data(), b.size());
    }

    std::uint8_t const*
    data() const
    {
        return buf_.data();
    }

    static constexpr std::size_t
    size()
    {
        return compressedSize;
    }

    Bytes const&
    bytes() const
    {
        return buf_;
    }

    Blob
    toBlob() const
    {
        return Blob(buf_.begin(), buf_.end());
    }

    /** 65 byte 0x04 || X || Y encoding. */
    std::array<std::uint8_t, 65>
    uncompressed() const;

    friend bool
    operator==(PublicKey const& a, PublicKey const& b)
    {
        return a.buf_ == b.buf_;
    }
    friend bool
    operator!=(PublicKey const& a, PublicKey const& b)
    {
        return a.buf_ != b.buf_;
    }

private:
    explicit PublicKey(Bytes const& b) : buf_(b)
    {
    }

    friend class SecretKey;
    friend std::optional<PublicKey>
    tweakAdd(PublicKey const&, uint256 const&);

    Bytes buf_;
};

/** A secp256k1 scalar in [1, n). Memory is wiped on destruction. */
class SecretKey
{
public:
    /** Draw a fresh key. Throws RandomnessUnavailable. */
    static SecretKey
    random();

    static std::optional<SecretKey>
    fromBytes(std::uint8_t const* data, std::size_t size);

    static std::optional<SecretKey>
    fromUint(uint256 const& v)
    {
        return fromBytes(v.data(), v.size());
    }

    SecretKey(SecretKey const& other) = default;
    SecretKey&
    operator=(SecretKey const& other) = default;
    ~SecretKey();

    std::uint8_t const*
    data() const
    {
        return buf_.data();
    }

    static constexpr std::size_t
    size()
    {
        return 32;
    }

    uint256
    toUint() const
    {
        return uint256::fromBytes(buf_.data(), buf_.size());
    }

    PublicKey
    publicKey() const;

    friend bool
    operator==(SecretKey const& a, SecretKey const& b)
    {
        return a.buf_ == b.buf_;
    }

private:
    SecretKey() = default;

    friend std::optional<SecretKey>
    tweakAdd(SecretKey const&, uint256 const&);

    std::array<std::uint8_t, 32> buf_{};
};

using SharedSecret = std::array<std::uint8_t, 33>;

/** Compressed encoding of priv * pub. */
SharedSecret
ecdh(SecretKey const& priv, PublicKey const& pub);

/** pub + tweak * G. Empty when the tweak is invalid or the sum is infinity. */
std::optional<PublicKey>
tweakAdd(PublicKey const& pub, uint256 const& tweak);

/** priv + tweak mod n. Empty when the tweak is invalid or the sum is zero. */
std::optional<SecretKey>
tweakAdd(SecretKey const& priv, uint256 const& tweak);

/** The secp256k1 group order n. */
uint256 const&
curveOrder();

/** Reduce a 256-bit value mod n. One subtraction suffices since 2^256 < 2n. */
uint256
reduceModOrder(uint256 const& v);

}  // namespace stealthpool

#endif
