#include "common/Hashing.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace optionlab {
namespace utils {

namespace {

std::string toHex(const unsigned char* digest, unsigned int length) {
    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex_stream.str();
}

} // namespace

std::string Hashing::sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.length(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string Hashing::sha256Hex(const std::vector<std::string>& lines) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest init failed");
    }

    for (const auto& line : lines) {
        if (EVP_DigestUpdate(ctx.get(), line.data(), line.size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), "\n", 1) != 1) {
            throw std::runtime_error("SHA-256 digest update failed");
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 digest final failed");
    }
    return toHex(hash, length);
}

} // namespace utils
} // namespace optionlab
