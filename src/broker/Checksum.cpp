#include "broker/Checksum.hpp"
#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include <openssl/evp.h>

namespace optgate {

    std::string broker_checksum(std::string_view timestamp, std::string_view body, std::string_view secret) {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw BrokerCallError("checksum: EVP_MD_CTX_new failed");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, timestamp.data(), timestamp.size()) == 1 &&
                  EVP_DigestUpdate(ctx, body.data(), body.size()) == 1 &&
                  EVP_DigestUpdate(ctx, secret.data(), secret.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) {
            throw BrokerCallError("checksum: SHA-256 digest failed");
        }

        static const char hex_chars[] = "0123456789abcdef";
        std::string out(hash_len * 2, '0');
        for (unsigned int i = 0; i < hash_len; ++i) {
            out[i * 2] = hex_chars[(hash[i] >> 4) & 0xF];
            out[i * 2 + 1] = hex_chars[hash[i] & 0xF];
        }
        return out;
    }

    std::string broker_timestamp() {
        return utils::iso8601_utc().substr(0, 19) + ".000Z";
    }

}
