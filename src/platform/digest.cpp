#include "binpack/digest.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace binpack {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        out.push_back(hex_chars[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

FileDigest digest_file(const std::string& file_path) {
    FileDigest result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    char buffer[16384];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        auto n = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer, n) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
        result.size += n;
    }
    if (file.bad()) {
        result.error = "read error: " + file_path;
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.sha256 = to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

} // namespace binpack
