#include "admedia/url_identity.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace admedia {

std::string identify(std::string_view url) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(url.data(), url.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string key;
    key.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        key.push_back(hex[digest[i] >> 4]);
        key.push_back(hex[digest[i] & 0x0f]);
    }
    return key;
}

}  // namespace admedia
