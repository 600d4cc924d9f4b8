#pragma once

#include "core/document/text_classifier.h"
#include "core/extraction/span_extractor.h"
#include "core/extraction/span_resolver.h"
#include "core/graph/graph_store.h"
#include "core/ontology/ontology_mapper.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slopgraph {

// Pipeline settings
struct ProcessorConfig {
    size_t workers{4};                                        // batch threads
    std::string file_extension{".txt"};                       // batch file filter
    std::chrono::milliseconds query_timeout{graph::kDefaultQueryTimeout};
    size_t default_limit{10};
};

// Extraction summary for one document
struct ProcessingMetadata {
    size_t total_concepts{0};
    size_t unique_labels{0};
    double avg_confidence{0.0};
    size_t content_length{0};      // preprocessed text, code points
    double concept_density{0.0};   // concepts per preprocessed word
};

// Result of one pipeline run
struct ProcessingResult {
    std::string document_id;
    Iri document_iri;
    std::optional<std::string> source_path;

    DocumentMetadata doc_metadata;
    std::vector<extraction::ResolvedConcept> concepts;
    extraction::DomainDistribution domain_distribution;
    ProcessingMetadata processing;

    size_t statements_generated{0};
    size_t concepts_mapped{0};
    size_t relationships_created{0};

    bool graph_stored{false};
    graph::InsertStats insert_stats;
};

// Outcome of a directory run; one failing file never stops the others
struct BatchResult {
    size_t files_found{0};
    std::vector<ProcessingResult> results;
    std::vector<std::pair<std::string, std::string>> failures;   // path, message
};

// Document pipeline:
//   classify → preprocess → extract → filter → resolve → map → insert
//
// Every step except the store write is pure, so documents may be processed
// concurrently; the store serializes inserts.
class DocumentProcessor {
public:
    DocumentProcessor(graph::GraphStore& store,
                      std::unique_ptr<extraction::SpanExtractor> extractor,
                      ProcessorConfig config = {},
                      ontology::MapperConfig mapper_config = {},
                      extraction::DomainTable domains = extraction::DomainTable::defaults());

    ~DocumentProcessor();

    DocumentProcessor(const DocumentProcessor&) = delete;
    DocumentProcessor& operator=(const DocumentProcessor&) = delete;

    // ========== Ingestion ==========

    Result<ProcessingResult> processContent(
        const std::string& content,
        const std::optional<std::string>& source_path = std::nullopt,
        bool store_in_graph = true);

    Result<ProcessingResult> processFile(const std::string& path);

    // Files directly inside `directory` ending in `extension` (config default when empty)
    Result<BatchResult> batchProcess(const std::string& directory, const std::string& extension = "");

    // ========== Queries ==========

    graph::QueryResult findRelatedDocuments(const std::string& concept_label,
                                            std::optional<size_t> limit = std::nullopt) const;

    graph::QueryResult findCoOccurringConcepts(const std::string& concept_label,
                                               std::optional<size_t> limit = std::nullopt) const;

    Result<graph::DocumentStats> getStatistics() const;

    // Turtle of a stored document and its concepts, nullopt when unknown
    std::optional<std::string> exportDocumentTurtle(const std::string& document_id) const;

    const ProcessorConfig& config() const { return config_; }

private:
    static ProcessingMetadata summarize(const std::vector<extraction::ResolvedConcept>& concepts,
                                        const std::string& cleaned_text);

    graph::GraphStore& store_;
    std::unique_ptr<extraction::SpanExtractor> extractor_;
    ProcessorConfig config_;

    document::TextClassifier classifier_;
    extraction::SpanResolver resolver_;
    ontology::OntologyMapper mapper_;
};

} // namespace slopgraph
