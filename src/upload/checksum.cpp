#include "chunkup/upload/checksum.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace chunkup::upload {
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

Result<std::string> sha256_hex(const std::uint8_t* data, std::size_t size) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<std::string>(std::string("Failed to allocate digest context"));
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(std::string("Failed to initialise SHA-256 digest"));
    }

    if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        return Err<std::string>(std::string("Failed to update SHA-256 digest"));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return Err<std::string>(std::string("Failed to finalise SHA-256 digest"));
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return Ok(hex.str());
}

} // namespace chunkup::upload
