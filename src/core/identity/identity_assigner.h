/**
 * @file identity_assigner.h
 * @brief Content-addressed identifiers for documents and concepts
 */

#pragma once

#include "../common/types.h"
#include <optional>
#include <string>
#include <string_view>

namespace slopgraph {
namespace identity {

/** Default number of hex characters kept from a digest */
inline constexpr size_t kDefaultDigestHexLength = 16;

/**
 * @brief Derives stable node identifiers
 *
 * Identifiers depend only on content: a document on its stable name or raw
 * text, a concept on its (text, label) pair. Position, confidence and
 * insertion order never contribute, so the same concept mentioned in two
 * documents becomes one graph node.
 */
class IdentityAssigner {
public:
    /**
     * @param digest_hex_length truncated digest length, clamped to [8, 64]
     */
    explicit IdentityAssigner(size_t digest_hex_length = kDefaultDigestHexLength);

    /**
     * @brief Document identifier
     * @param content raw document text
     * @param stable_name file stem or other caller-chosen name; when present
     *        the id is the percent-encoded name and content is ignored
     */
    [[nodiscard]] std::string documentId(
        std::string_view content,
        const std::optional<std::string>& stable_name = std::nullopt) const;

    /**
     * @brief Concept identifier, case-sensitive over text and label
     */
    [[nodiscard]] std::string conceptId(std::string_view text, std::string_view label) const;

    /** Short-form node name "slop:document/<id>" */
    [[nodiscard]] static Iri documentIri(const std::string& document_id);

    /** Short-form node name "slop:concept/<id>" */
    [[nodiscard]] static Iri conceptIri(const std::string& concept_id);

    /**
     * @brief Stable name for a file path (its stem), nullopt for empty stems
     */
    [[nodiscard]] static std::optional<std::string> stableNameFromPath(const std::string& path);

    /**
     * @brief Full lowercase hex SHA-256 of the input
     * @throws std::runtime_error when the digest backend fails
     */
    [[nodiscard]] static std::string sha256Hex(std::string_view data);

    /**
     * @brief RFC 3986 percent-encoding, unreserved characters kept
     */
    [[nodiscard]] static std::string percentEncode(std::string_view text);

    [[nodiscard]] size_t digestHexLength() const noexcept { return digest_hex_length_; }

private:
    size_t digest_hex_length_;
};

} // namespace identity
} // namespace slopgraph
