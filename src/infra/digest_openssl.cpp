#include "rg/digest.hpp"

#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

#include "rg/errors.hpp"

namespace rg
{
std::string sha256_hex(std::string_view data)
{
    const EVP_MD *md = EVP_sha256();
    if (nullptr == md)
        throw Error(ErrorKind::IOFailure, "[OpenSSL] Failed preparing SHA256 MD context");

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        throw Error(ErrorKind::IOFailure, "[OpenSSL] Failed creating hash context");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1)
        throw Error(ErrorKind::IOFailure, "[OpenSSL] SHA256 digest failed");

    std::ostringstream output;
    for (unsigned int i = 0; i < len; i++)
    {
        output << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(hash[i]);
    }
    return output.str();
}
} // namespace rg
