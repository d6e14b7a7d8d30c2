#include "util/digest.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace ferry::util {

Digest::Digest(const DigestAlgorithm algo) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    const EVP_MD* md = algo == DigestAlgorithm::Md5 ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Digest::~Digest() { EVP_MD_CTX_free(ctx_); }

void Digest::update(const void* data, const size_t len) {
    if (finalized_) throw std::logic_error("Digest already finalized");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Digest::hexFinal() {
    if (finalized_) throw std::logic_error("Digest already finalized");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
    finalized_ = true;

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    return oss.str();
}

std::string md5Hex(const std::string_view data) {
    Digest d(DigestAlgorithm::Md5);
    d.update(data);
    return d.hexFinal();
}

std::string sha256Hex(const std::string_view data) {
    Digest d(DigestAlgorithm::Sha256);
    d.update(data);
    return d.hexFinal();
}

}
