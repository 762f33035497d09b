#include "../include/hashing.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fstream>
#include <memory>

std::string canonical_params(const Params& params) {
    if (params.is_null()) return "{}";
    if (!params.is_object()) {
        throw MalformedInputError(std::string("parameters must be an object, got ") + params.type_name());
    }
    // nlohmann::json stores objects in a std::map, so dump() emits sorted keys
    // regardless of how the caller built the object.
    try {
        return params.dump();
    } catch (const nlohmann::json::exception& e) {
        throw MalformedInputError(std::string("parameters cannot be canonicalized: ") + e.what());
    }
}

std::string fingerprint(const std::string& subject, const std::string& query_kind, const Params& params) {
    // A JSON array keeps the parts apart even when subject or kind contain ':'.
    std::string key = nlohmann::json::array({subject, query_kind, canonical_params(params)}).dump();
    return content_hash(key);
}

std::string content_hash(const std::string& bytes) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), md);
    return to_hex(md, SHA256_DIGEST_LENGTH);
}

std::string content_hash_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw StorageUnavailableError("cannot open file: " + p.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw StorageUnavailableError("sha256 init failed");
    }
    char buf[1 << 16];
    while (f) {
        f.read(buf, sizeof(buf));
        std::streamsize n = f.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf, (size_t)n) != 1) {
            throw StorageUnavailableError("sha256 update failed");
        }
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) throw StorageUnavailableError("sha256 final failed");
    return to_hex(md, len);
}
