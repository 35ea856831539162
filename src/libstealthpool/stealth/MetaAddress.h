#ifndef STEALTHPOOL_STEALTH_METAADDRESS_H_INCLUDED
#define STEALTHPOOL_STEALTH_METAADDRESS_H_INCLUDED

#include <libstealthpool/crypto/Secp256k1.h>

#include <string>

namespace stealthpool {

/** A recipient's long-lived public identity.

    Payers derive a fresh stealth address from it for every payment. The
    viewing key lets its holder detect payments; spending additionally
    needs the spend private key.
*/
struct MetaAddress
{
    PublicKey spendPublicKey;
    PublicKey viewingPublicKey;
};

inline bool
operator==(MetaAddress const& a, MetaAddress const& b)
{
    return a.spendPublicKey == b.spendPublicKey &&
        a.viewingPublicKey == b.viewingPublicKey;
}

/** A meta-address together with the two private keys behind it. */
struct MetaKeys
{
    MetaAddress metaAddress;
    SecretKey spendPrivateKey;
    SecretKey viewingPrivateKey;
};

/** Textual prefix of an encoded meta-address. */
extern char const* const metaAddressPrefix;

/** Draw two independent key pairs.

    @throws StealthError(RandomnessUnavailable)
*/
MetaKeys
generateMetaAddress();

/** "stmeta:" followed by the two compressed keys in hex, spend first. */
std::string
encodeMetaAddress(MetaAddress const& meta);

/** Inverse of encodeMetaAddress.

    @throws std::invalid_argument if the prefix, length or hex is wrong
    @throws StealthError(InvalidKey) if either key is not a curve point
*/
MetaAddress
decodeMetaAddress(std::string const& text);

}  // namespace stealthpool

#endif
