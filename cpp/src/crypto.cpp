#include "repeathd/crypto.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace repeathd::crypto {

namespace {

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

Bytes Sha256(std::string_view data) {
    UniqueMDCtx ctx(EVP_MD_CTX_new());
    Ensure(static_cast<bool>(ctx), "Digest context allocation failed");
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "Digest init failed");
    if (!data.empty()) {
        Ensure(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1, "Digest update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "Digest final failed");
    out.resize(out_len);
    return out;
}

}  // namespace repeathd::crypto
