#include "fplaunch/digest.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace fplaunch {

namespace {

// Incremental SHA-256 over one EVP context; the first failure sticks
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            error_ = "cannot allocate digest context";
        } else if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            error_ = "cannot initialise sha256";
        }
    }
    ~Sha256() { EVP_MD_CTX_free(ctx_); }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void feed(const void* data, size_t len) {
        if (!error_.empty()) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) error_ = "sha256 update failed";
    }

    void fail(std::string why) {
        if (error_.empty()) error_ = std::move(why);
    }

    HashResult finish() {
        HashResult result;
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (error_.empty() && EVP_DigestFinal_ex(ctx_, md, &md_len) != 1) {
            error_ = "sha256 finalisation failed";
        }
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }

        static const char digits[] = "0123456789abcdef";
        result.hex_digest.reserve(md_len * 2);
        for (unsigned int i = 0; i < md_len; ++i) {
            result.hex_digest += digits[md[i] >> 4];
            result.hex_digest += digits[md[i] & 0x0f];
        }
        result.ok = true;
        return result;
    }

private:
    EVP_MD_CTX* ctx_;
    std::string error_;
};

} // namespace

HashResult compute_sha256(const std::string& data) {
    Sha256 sha;
    sha.feed(data.data(), data.size());
    return sha.finish();
}

HashResult compute_file_sha256(const std::string& file_path) {
    Sha256 sha;
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        sha.fail("cannot open " + file_path);
        return sha.finish();
    }

    char chunk[8192];
    while (in) {
        in.read(chunk, sizeof(chunk));
        if (in.gcount() > 0) sha.feed(chunk, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) sha.fail("read error on " + file_path);
    return sha.finish();
}

} // namespace fplaunch
