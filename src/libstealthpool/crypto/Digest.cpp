#include <libstealthpool/crypto/Digest.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <memory>
#include <stdexcept>

namespace stealthpool {

uint256
sha256(std::uint8_t const* data, std::size_t size)
{
    uint256 result;
    SHA256(data, size, result.data());
    return result;
}

uint256
sha3_256(std::uint8_t const* data, std::size_t size)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("sha3_256: context allocation failed");

    uint256 result;
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), result.data(), &len) != 1 ||
        len != uint256::size())
        throw std::runtime_error("sha3_256: digest failed");
    return result;
}

void
secureErase(void* p, std::size_t size)
{
    OPENSSL_cleanse(p, size);
}

}  // namespace stealthpool
