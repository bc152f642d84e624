#include "crypto/digest.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace sfg::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

auto openssl_error(std::string_view what) -> DigestError {
    char buf[256] = {};
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return DigestError{std::string(what) + ": " + buf};
}

} // anonymous namespace

auto sha1_hex(std::string_view data) -> Result<std::string, DigestError> {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return openssl_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        return openssl_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return openssl_error("EVP_DigestUpdate failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return openssl_error("EVP_DigestFinal_ex failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace sfg::crypto
