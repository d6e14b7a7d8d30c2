#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ferry::util {

enum class DigestAlgorithm { Md5, Sha256 };

// Incremental OpenSSL EVP digest producing lower-case hex.
class Digest {
public:
    explicit Digest(DigestAlgorithm algo);
    ~Digest();

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(const void* data, size_t len);
    void update(std::string_view s) { update(s.data(), s.size()); }

    // Finalises the context; further updates throw.
    std::string hexFinal();

private:
    EVP_MD_CTX* ctx_;
    bool finalized_ = false;
};

std::string md5Hex(std::string_view data);
std::string sha256Hex(std::string_view data);

}
