#ifndef STEALTHPOOL_STEALTH_STEALTHADDRESS_H_INCLUDED
#define STEALTHPOOL_STEALTH_STEALTHADDRESS_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/strHex.h>
#include <libstealthpool/crypto/Secp256k1.h>
#include <libstealthpool/stealth/MetaAddress.h>

#include <cstdint>
#include <string>

namespace stealthpool {

/** What the payer publishes alongside a payment, plus the derived key. */
struct StealthPayment
{
    AccountID stealthAddress;
    PublicKey stealthPublicKey;
    PublicKey ephemeralPublicKey;
    std::uint8_t viewHint;
    std::uint32_t k;
};

struct KeyValidation
{
    bool valid = false;
    std::string reason;
};

/** SHA-256(shared || k as 4 bytes big-endian) reduced mod n. */
uint256
stealthTweak(SharedSecret const& shared, std::uint32_t k);

/** Last 20 bytes of the SHA3-256 digest of the 64 byte X || Y encoding. */
AccountID
stealthAddressFromPublicKey(PublicKey const& pub);

/** Derive the one-time destination for a payment to meta.

    stealthPublicKey = spendPublicKey + tweak * G where the tweak comes from
    ECDH(ephemeralPrivateKey, viewingPublicKey) and k.

    @throws StealthError(InvalidKey) if the tweak lands on the point at
            infinity (negligible for honest keys)
*/
StealthPayment
deriveStealthAddress(
    MetaAddress const& meta,
    SecretKey const& ephemeralPrivateKey,
    std::uint32_t k = 0);

/** Same, with a fresh ephemeral key.

    @throws StealthError(RandomnessUnavailable)
*/
StealthPayment
deriveStealthAddress(MetaAddress const& meta, std::uint32_t k = 0);

/** Same, taking raw key bytes as a payer would receive them.

    @throws StealthError(InvalidKey) if either public key is malformed or the
            ephemeral private key is not a valid scalar
*/
StealthPayment
deriveStealthAddress(
    Blob const& spendPublicKey,
    Blob const& viewingPublicKey,
    Blob const& ephemeralPrivateKey,
    std::uint32_t k = 0);

/** spendPrivateKey + tweak mod n, the key controlling the stealth address.

    @throws StealthError(InvalidKey)
*/
SecretKey
recoverStealthPrivateKey(
    SecretKey const& viewingPrivateKey,
    SecretKey const& spendPrivateKey,
    PublicKey const& ephemeralPublicKey,
    std::uint32_t k = 0);

/** Raw byte form of recoverStealthPrivateKey.

    @throws StealthError(InvalidKey)
*/
SecretKey
recoverStealthPrivateKey(
    Blob const& viewingPrivateKey,
    Blob const& spendPrivateKey,
    Blob const& ephemeralPublicKey,
    std::uint32_t k = 0);

/** Check a compressed public key: 33 bytes, 0x02/0x03 tag, on curve. */
KeyValidation
validatePublicKey(Blob const& bytes);

/** Cheap first pass of scanning: does the first shared secret byte match?

    Matches one in 256 foreign payments; confirm with matchesStealthAddress.
*/
bool
checkViewHint(
    SecretKey const& viewingPrivateKey,
    PublicKey const& ephemeralPublicKey,
    std::uint8_t viewHint);

/** Full check that a payment announcement is addressed to this recipient. */
bool
matchesStealthAddress(
    SecretKey const& viewingPrivateKey,
    PublicKey const& spendPublicKey,
    PublicKey const& ephemeralPublicKey,
    std::uint32_t k,
    AccountID const& stealthAddress);

}  // namespace stealthpool

#endif
