#include "fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace avatarlink {
namespace delivery {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

void update_field(EVP_MD_CTX *ctx, const std::string &field) {
    const uint64_t len = field.size();
    std::array<unsigned char, 8> prefix{};
    for (size_t i = 0; i < prefix.size(); ++i) {
        prefix[i] = static_cast<unsigned char>((len >> (8 * i)) & 0xFF);
    }
    if (EVP_DigestUpdate(ctx, prefix.data(), prefix.size()) != 1 ||
        EVP_DigestUpdate(ctx, field.data(), field.size()) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
}

}  // namespace

std::string compute_fingerprint(const SpeakPayload &payload) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest initialization failed");
    }

    update_field(ctx.get(), payload.avatar_id);
    update_field(ctx.get(), payload.text);
    update_field(ctx.get(), payload.emotion);
    update_field(ctx.get(), payload.language);
    update_field(ctx.get(), payload.voice_id);
    update_field(ctx.get(), payload.gesture);

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest finalization failed");
    }

    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += kHex[digest[i] >> 4];
        hex += kHex[digest[i] & 0x0F];
    }
    return hex;
}

}  // namespace delivery
}  // namespace avatarlink
