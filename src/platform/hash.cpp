#include "flowpack/hash.hpp"

#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace flowpack {

namespace {

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// Incremental SHA-256. The first failing EVP call is remembered and every
// later call becomes a no-op.
class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            error_ = "cannot allocate digest context";
        } else if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error_ = "cannot initialise sha256";
        }
    }

    void update(const void* data, size_t size) {
        if (!error_.empty() || size == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            error_ = "sha256 update failed";
        }
    }

    HashResult finish() {
        HashResult result;
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            result.error = "sha256 finalisation failed";
            return result;
        }

        static const char digits[] = "0123456789abcdef";
        result.hex_digest.resize(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            result.hex_digest[2 * i] = digits[digest[i] >> 4];
            result.hex_digest[2 * i + 1] = digits[digest[i] & 0x0F];
        }
        result.ok = true;
        return result;
    }

private:
    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx_;
    std::string error_;
};

} // namespace

HashResult sha256_bytes(const std::vector<uint8_t>& data) {
    Sha256Stream sha;
    sha.update(data.data(), data.size());
    return sha.finish();
}

HashResult sha256_text(const std::string& text) {
    Sha256Stream sha;
    sha.update(text.data(), text.size());
    return sha.finish();
}

HashResult sha256_file(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        HashResult result;
        result.error = "cannot open " + file_path;
        return result;
    }

    Sha256Stream sha;
    char chunk[16384];
    while (in) {
        in.read(chunk, sizeof(chunk));
        sha.update(chunk, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        HashResult result;
        result.error = "read error in " + file_path;
        return result;
    }
    return sha.finish();
}

std::string normalize_hash_hex(const std::string& hash) {
    auto colon = hash.find(':');
    return colon == std::string::npos ? hash : hash.substr(colon + 1);
}

} // namespace flowpack
