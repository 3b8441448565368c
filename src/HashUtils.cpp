#include "HashUtils.h"
#include "FluxGuardExceptions.h"

// OpenSSL 3.x deprecates the low-level SHA256_* calls; EVP covers every version we build against.
#include <openssl/evp.h>

#include <fstream>
#include <iterator>

namespace {
int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

namespace HashUtils {
Digest sha256(const uint8_t* data, size_t len) {
    Digest out{};
    unsigned int outLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw FluxGuard::FluxGuardException("OpenSSL: EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data, len) != 1 ||
        EVP_DigestFinal_ex(ctx, out.data(), &outLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw FluxGuard::FluxGuardException("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);
    return out;
}

Digest sha256(const std::vector<uint8_t>& bytes) {
    return sha256(bytes.data(), bytes.size());
}

Digest sha256(const std::string& text) {
    return sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string toHex(const Digest& digest) {
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::string sha256Hex(const std::vector<uint8_t>& bytes) {
    return toHex(sha256(bytes));
}

std::string sha256Hex(const std::string& text) {
    return toHex(sha256(text));
}

uint32_t seedFromHexPrefix(const std::string& hex) {
    if (hex.size() < 8) {
        throw FluxGuard::DatasetException("Digest too short for seed derivation: " + hex);
    }
    uint32_t seed = 0;
    for (size_t i = 0; i < 8; ++i) {
        const int v = hexValue(hex[i]);
        if (v < 0) throw FluxGuard::DatasetException("Invalid hex digit in digest: " + hex);
        seed = (seed << 4) | static_cast<uint32_t>(v);
    }
    return seed;
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw FluxGuard::IOException("Could not open file: " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw FluxGuard::IOException("Failed while reading file: " + path);
    return bytes;
}
}
