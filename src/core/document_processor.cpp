#include "document_processor.h"
#include "core/identity/identity_assigner.h"
#include "core/rdf/namespaces.h"
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace slopgraph {

namespace fs = std::filesystem;

DocumentProcessor::DocumentProcessor(graph::GraphStore& store,
                                     std::unique_ptr<extraction::SpanExtractor> extractor,
                                     ProcessorConfig config,
                                     ontology::MapperConfig mapper_config,
                                     extraction::DomainTable domains)
    : store_(store)
    , extractor_(std::move(extractor))
    , config_(std::move(config))
    , resolver_(std::move(domains))
    , mapper_(mapper_config) {

    if (config_.workers == 0) {
        config_.workers = 1;
    }
    std::cout << "[DocumentProcessor] Pipeline initialized" << std::endl;
}

DocumentProcessor::~DocumentProcessor() = default;

// ========== Ingestion ==========

Result<ProcessingResult> DocumentProcessor::processContent(
    const std::string& content,
    const std::optional<std::string>& source_path,
    bool store_in_graph) {

    if (!extractor_) {
        return Result<ProcessingResult>(ErrorCode::INVALID_ARGUMENT, "No span extractor configured");
    }

    ProcessingResult result;
    result.source_path = source_path;

    // 1. Classify the raw document
    result.doc_metadata = classifier_.classify(content);
    std::cout << std::format("[DocumentProcessor] Detected {} document (confidence {:.2f})",
                             documentTypeToString(result.doc_metadata.doc_type),
                             result.doc_metadata.confidence) << std::endl;

    // 2. Extract spans from the cleaned text
    const std::string cleaned = document::TextClassifier::preprocess(content);
    std::vector<extraction::Span> spans;
    if (!cleaned.empty()) {
        auto extracted = extractor_->extract(cleaned);
        if (extracted.isError()) {
            std::cerr << std::format("[DocumentProcessor] Extraction failed: {}",
                                     extracted.errorMessage()) << std::endl;
            return Result<ProcessingResult>(extracted.errorCode(), extracted.errorMessage());
        }
        spans = std::move(extracted).value();
    }

    // 3. Validate offsets and resolve overlaps
    spans = extraction::SpanResolver::filterMalformed(std::move(spans), utf8Length(cleaned));
    result.concepts = resolver_.resolve(std::move(spans));
    result.domain_distribution = extraction::computeDomainDistribution(result.concepts);
    result.processing = summarize(result.concepts, cleaned);
    std::cout << std::format("[DocumentProcessor] Resolved {} concepts across {} domains",
                             result.concepts.size(), result.domain_distribution.size()) << std::endl;

    // 4. Map to statements
    auto mapping = mapper_.map(content, result.concepts, result.doc_metadata, source_path);

    std::optional<std::string> stable_name;
    if (source_path) {
        stable_name = identity::IdentityAssigner::stableNameFromPath(*source_path);
    }
    result.document_id = mapper_.identity().documentId(content, stable_name);
    result.document_iri = mapping.document_iri.value_or(
        identity::IdentityAssigner::documentIri(result.document_id));
    result.statements_generated = mapping.size();
    result.concepts_mapped = mapping.concepts_mapped;
    result.relationships_created = mapping.relationships_created;

    // 5. Store
    if (store_in_graph) {
        auto inserted = store_.insert(mapping);
        if (inserted.isError()) {
            std::cerr << std::format("[DocumentProcessor] Graph storage failed: {}",
                                     inserted.errorMessage()) << std::endl;
            return Result<ProcessingResult>(inserted.errorCode(), inserted.errorMessage());
        }
        result.insert_stats = inserted.value();
        result.graph_stored = true;
    }

    std::cout << std::format("[DocumentProcessor] Generated {} statements for {}",
                             result.statements_generated, result.document_iri) << std::endl;
    return Result<ProcessingResult>(std::move(result));
}

Result<ProcessingResult> DocumentProcessor::processFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<ProcessingResult>(ErrorCode::STORAGE_NOT_FOUND,
            std::format("File not found: {}", path));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<ProcessingResult>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Cannot open file: {}", path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<ProcessingResult>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to read file: {}", path));
    }

    std::cout << std::format("[DocumentProcessor] Processing file: {}", path) << std::endl;
    return processContent(buffer.str(), path);
}

Result<BatchResult> DocumentProcessor::batchProcess(const std::string& directory,
                                                    const std::string& extension) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Result<BatchResult>(ErrorCode::STORAGE_NOT_FOUND,
            std::format("Directory not found: {}", directory));
    }

    const std::string& suffix = extension.empty() ? config_.file_extension : extension;

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == suffix) {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        return Result<BatchResult>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Cannot list {}: {}", directory, ec.message()));
    }
    std::sort(files.begin(), files.end());

    std::cout << std::format("[DocumentProcessor] Batch processing {} files in {} matching *{}",
                             files.size(), directory, suffix) << std::endl;

    std::vector<std::optional<Result<ProcessingResult>>> outcomes(files.size());
    {
        folly::CPUThreadPoolExecutor executor(std::min(config_.workers, std::max<size_t>(files.size(), 1)));
        for (size_t i = 0; i < files.size(); i++) {
            executor.add([this, &files, &outcomes, i]() {
                outcomes[i] = processFile(files[i]);
            });
        }
        executor.join();
    }

    BatchResult batch;
    batch.files_found = files.size();
    for (size_t i = 0; i < files.size(); i++) {
        auto& outcome = outcomes[i];
        if (outcome && outcome->isOk()) {
            batch.results.push_back(std::move(*outcome).value());
        } else {
            std::string message = outcome ? outcome->errorMessage() : "not processed";
            std::cerr << std::format("[DocumentProcessor] Failed to process {}: {}", files[i], message) << std::endl;
            batch.failures.emplace_back(files[i], std::move(message));
        }
    }

    std::cout << std::format("[DocumentProcessor] Batch complete: {}/{} files processed",
                             batch.results.size(), batch.files_found) << std::endl;
    return Result<BatchResult>(std::move(batch));
}

// ========== Queries ==========

graph::QueryResult DocumentProcessor::findRelatedDocuments(const std::string& concept_label,
                                                           std::optional<size_t> limit) const {
    return store_.findRelatedDocuments(concept_label, limit.value_or(config_.default_limit),
                                       config_.query_timeout);
}

graph::QueryResult DocumentProcessor::findCoOccurringConcepts(const std::string& concept_label,
                                                              std::optional<size_t> limit) const {
    return store_.findCoOccurringConcepts(concept_label, limit.value_or(config_.default_limit),
                                          config_.query_timeout);
}

Result<graph::DocumentStats> DocumentProcessor::getStatistics() const {
    return store_.getDocumentStats(config_.query_timeout);
}

std::optional<std::string> DocumentProcessor::exportDocumentTurtle(const std::string& document_id) const {
    auto iri = rdf::NamespaceTable::standard().expand(
        identity::IdentityAssigner::documentIri(document_id));
    if (iri.isError()) {
        return std::nullopt;
    }
    return store_.exportSubgraph(iri.value());
}

// ========== Helpers ==========

ProcessingMetadata DocumentProcessor::summarize(const std::vector<extraction::ResolvedConcept>& concepts,
                                                const std::string& cleaned_text) {
    ProcessingMetadata metadata;
    metadata.total_concepts = concepts.size();
    metadata.content_length = utf8Length(cleaned_text);

    std::set<std::string> labels;
    double confidence_sum = 0.0;
    for (const auto& item : concepts) {
        labels.insert(item.label());
        confidence_sum += item.confidence();
    }
    metadata.unique_labels = labels.size();
    if (!concepts.empty()) {
        metadata.avg_confidence = confidence_sum / static_cast<double>(concepts.size());
    }

    std::istringstream words(cleaned_text);
    size_t word_count = 0;
    std::string word;
    while (words >> word) {
        word_count++;
    }
    if (word_count > 0) {
        metadata.concept_density = static_cast<double>(concepts.size()) / static_cast<double>(word_count);
    }

    return metadata;
}

} // namespace slopgraph
