/**
 * @file namespaces.h
 * @brief Vocabulary constants and prefix expansion
 */

#pragma once

#include "statement.h"
#include <optional>
#include <string>
#include <string_view>

namespace slopgraph {
namespace rdf {

// =============================================================================
// Vocabulary
// =============================================================================

namespace ns {
inline constexpr const char* SLOP   = "http://slop.at/ontology#";
inline constexpr const char* RDF    = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr const char* RDFS   = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr const char* OWL    = "http://www.w3.org/2002/07/owl#";
inline constexpr const char* XSD    = "http://www.w3.org/2001/XMLSchema#";
inline constexpr const char* FOAF   = "http://xmlns.com/foaf/0.1/";
inline constexpr const char* DCT    = "http://purl.org/dc/terms/";
inline constexpr const char* CSO    = "http://cso.kmi.open.ac.uk/";
inline constexpr const char* MSC    = "http://msc2010.org/";
inline constexpr const char* SCHEMA = "http://schema.org/";
} // namespace ns

namespace vocab {
inline const std::string RDF_TYPE     = std::string(ns::RDF) + "type";
inline const std::string RDFS_LABEL   = std::string(ns::RDFS) + "label";
inline const std::string DCT_TITLE    = std::string(ns::DCT) + "title";
inline const std::string OWL_CLASS    = std::string(ns::OWL) + "Class";

inline const std::string XSD_FLOAT    = std::string(ns::XSD) + "float";
inline const std::string XSD_DOUBLE   = std::string(ns::XSD) + "double";
inline const std::string XSD_DECIMAL  = std::string(ns::XSD) + "decimal";
inline const std::string XSD_INTEGER  = std::string(ns::XSD) + "integer";
inline const std::string XSD_BOOLEAN  = std::string(ns::XSD) + "boolean";

inline const std::string SLOP_DOCUMENT         = std::string(ns::SLOP) + "Document";
inline const std::string SLOP_CONCEPT          = std::string(ns::SLOP) + "Concept";
inline const std::string SLOP_DISCUSSES        = std::string(ns::SLOP) + "discusses";
inline const std::string SLOP_CO_OCCURS_WITH   = std::string(ns::SLOP) + "coOccursWith";
inline const std::string SLOP_TYPE_CONFIDENCE  = std::string(ns::SLOP) + "typeConfidence";
inline const std::string SLOP_CONFIDENCE       = std::string(ns::SLOP) + "confidence";
inline const std::string SLOP_PRIMARY_DOMAIN   = std::string(ns::SLOP) + "primaryDomain";
inline const std::string SLOP_EXTRACTION_LABEL = std::string(ns::SLOP) + "extractionLabel";
} // namespace vocab

/**
 * @brief True for terms already in full URI form ("scheme://..." or "urn:...")
 */
[[nodiscard]] bool isAbsoluteIri(std::string_view term) noexcept;

// =============================================================================
// NamespaceTable
// =============================================================================

/**
 * @brief Ordered prefix table used to expand and compact identifiers
 */
class NamespaceTable {
public:
    NamespaceTable() = default;
    explicit NamespaceTable(NamespaceBindings bindings) : bindings_(std::move(bindings)) {}

    /**
     * @brief slop, rdf, rdfs, owl, xsd, foaf, dct, cso, msc and schema prefixes
     */
    [[nodiscard]] static const NamespaceTable& standard();

    /**
     * @brief Add or rebind a prefix, keeping first-bound order
     */
    void bind(const std::string& prefix, const std::string& uri);

    /**
     * @brief Namespace URI bound to a prefix
     */
    [[nodiscard]] std::optional<std::string> uriFor(std::string_view prefix) const;

    /**
     * @brief Expand "prefix:local" to a full URI, absolute IRIs pass through
     * @return full IRI, or INVALID_ARGUMENT / PREFIX_UNKNOWN
     */
    [[nodiscard]] Result<Iri> expand(std::string_view term) const;

    /**
     * @brief Short form using the longest matching namespace
     * @return nullopt when no namespace matches or the local part would not
     *         be a valid prefixed name
     */
    [[nodiscard]] std::optional<std::string> compact(const Iri& iri) const;

    [[nodiscard]] const NamespaceBindings& bindings() const noexcept { return bindings_; }

private:
    NamespaceBindings bindings_;
};

} // namespace rdf
} // namespace slopgraph
