/**
 * @file ontology_mapper.h
 * @brief Maps resolved concepts and document metadata to statements
 */

#pragma once

#include "../common/types.h"
#include "../extraction/span.h"
#include "../identity/identity_assigner.h"
#include "../rdf/namespaces.h"
#include "../rdf/statement.h"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace slopgraph {
namespace ontology {

/**
 * @brief Mapper tuning knobs
 */
struct MapperConfig {
    int64_t cooccurrence_window = 100;                          // start offset distance, code points
    size_t digest_hex_length = identity::kDefaultDigestHexLength;
};

/**
 * @brief Extraction label → standard ontology class (short form)
 */
[[nodiscard]] const std::unordered_map<std::string, std::string>& defaultConceptClasses();

/**
 * @brief Builds the statement set for one document
 *
 * Output blocks, in order: document, per-concept, co-occurrence edges and
 * domain aggregates. Every short-form term is expanded through the
 * namespace table; a statement whose expansion fails is dropped and logged
 * while the rest of the set proceeds.
 *
 * Holds only immutable tables, so one mapper may serve many threads.
 */
class OntologyMapper {
public:
    explicit OntologyMapper(
        MapperConfig config = {},
        rdf::NamespaceTable namespaces = rdf::NamespaceTable::standard(),
        std::unordered_map<std::string, std::string> concept_classes = defaultConceptClasses());

    /**
     * @brief Build statements for a processed document
     * @param content raw document text (identity input when no path is given)
     * @param concepts resolved concepts in resolution order
     * @param metadata classifier output
     * @param source_path originating file; its stem names the document
     * @return statement set with bookkeeping counters
     */
    [[nodiscard]] rdf::StatementSet map(
        std::string_view content,
        const std::vector<extraction::ResolvedConcept>& concepts,
        const DocumentMetadata& metadata,
        const std::optional<std::string>& source_path = std::nullopt) const;

    /**
     * @brief Standard class mapped to an extraction label, if any
     */
    [[nodiscard]] std::optional<std::string> conceptClassFor(const std::string& label) const;

    [[nodiscard]] const identity::IdentityAssigner& identity() const noexcept { return identity_; }
    [[nodiscard]] const MapperConfig& config() const noexcept { return config_; }

    /**
     * @brief "cs" → "Cs", "social_science" → "Social_Science"
     */
    [[nodiscard]] static std::string titleCase(std::string_view word);

private:
    // Expand and append; false when the statement was dropped
    bool emit(rdf::StatementSet& out, std::string_view subject,
              std::string_view predicate, rdf::Term object) const;

    void emitDocumentBlock(rdf::StatementSet& out, const std::string& doc,
                           const DocumentMetadata& metadata,
                           const std::optional<std::string>& source_path) const;

    std::vector<std::string> emitConceptBlocks(rdf::StatementSet& out, const std::string& doc,
                                               const std::vector<extraction::ResolvedConcept>& concepts) const;

    size_t emitCoOccurrences(rdf::StatementSet& out,
                             const std::vector<extraction::ResolvedConcept>& concepts,
                             const std::vector<std::string>& concept_iris) const;

    size_t emitDomainAggregates(rdf::StatementSet& out, const std::string& doc,
                                const std::vector<extraction::ResolvedConcept>& concepts) const;

    MapperConfig config_;
    rdf::NamespaceTable namespaces_;
    std::unordered_map<std::string, std::string> concept_classes_;
    identity::IdentityAssigner identity_;
};

} // namespace ontology
} // namespace slopgraph
