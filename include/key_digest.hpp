#pragma once

#include <string>
#include <algorithm>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/evp.h>
#include <openssl/md5.h>

#include "service_error.hpp"

namespace shorten {

// Content digest used to derive short keys.
// MD5 over the raw value, encoded with the URL-safe base64 alphabet and no
// padding: 16 bytes always encode to 22 characters.
class KeyDigest {
public:
    static constexpr size_t DIGEST_LENGTH = 22;

    /**
     * Computes the URL-safe digest string of a value.
     * @throws ServiceError INTERNAL if the OpenSSL digest context fails.
     */
    static std::string compute(const std::string& value) {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw ServiceError::internal("failed to allocate digest context");
        }

        bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, value.data(), value.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, md, &md_len) == 1;
        EVP_MD_CTX_free(ctx);

        if (!ok || md_len != MD5_DIGEST_LENGTH) {
            throw ServiceError::internal("failed to write hash");
        }
        return base64url(md, md_len);
    }

    // Beast's codec emits the standard alphabet; remap it and drop the padding.
    static std::string base64url(const unsigned char* data, size_t len) {
        std::string out;
        out.resize(boost::beast::detail::base64::encoded_size(len));
        out.resize(boost::beast::detail::base64::encode(&out[0], data, len));

        while (!out.empty() && out.back() == '=') {
            out.pop_back();
        }
        std::replace(out.begin(), out.end(), '+', '-');
        std::replace(out.begin(), out.end(), '/', '_');
        return out;
    }
};

}
