/**
 * @file identity_assigner.cpp
 * @brief SHA-256 based identifier derivation
 */

#include "identity_assigner.h"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>

namespace slopgraph {
namespace identity {

namespace {

constexpr size_t kMinDigestHexLength = 8;
constexpr size_t kMaxDigestHexLength = 64;

} // anonymous namespace

IdentityAssigner::IdentityAssigner(size_t digest_hex_length)
    : digest_hex_length_(std::clamp(digest_hex_length, kMinDigestHexLength, kMaxDigestHexLength)) {
}

std::string IdentityAssigner::documentId(
    std::string_view content, const std::optional<std::string>& stable_name) const {

    if (stable_name && !stable_name->empty()) {
        return percentEncode(*stable_name);
    }
    return "doc-" + sha256Hex(content).substr(0, digest_hex_length_);
}

std::string IdentityAssigner::conceptId(std::string_view text, std::string_view label) const {
    // NUL separator keeps ("ab", "c") and ("a", "bc") apart
    std::string material;
    material.reserve(text.size() + label.size() + 1);
    material.append(text);
    material.push_back('\0');
    material.append(label);
    return sha256Hex(material).substr(0, digest_hex_length_);
}

Iri IdentityAssigner::documentIri(const std::string& document_id) {
    return "slop:document/" + document_id;
}

Iri IdentityAssigner::conceptIri(const std::string& concept_id) {
    return "slop:concept/" + concept_id;
}

std::optional<std::string> IdentityAssigner::stableNameFromPath(const std::string& path) {
    auto stem = std::filesystem::path(path).stem().string();
    if (stem.empty()) {
        return std::nullopt;
    }
    return stem;
}

std::string IdentityAssigner::sha256Hex(std::string_view data) {
    std::array<unsigned char, 32> digest{};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    if (digest_len != digest.size()) {
        throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        out.push_back(hex[byte >> 4]);
        out.push_back(hex[byte & 0x0F]);
    }
    return out;
}

std::string IdentityAssigner::percentEncode(std::string_view text) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace identity
} // namespace slopgraph
