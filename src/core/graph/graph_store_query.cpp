/**
 * @file graph_store_query.cpp
 * @brief Query templates, scans and export
 */

#include "graph_store.h"
#include "graph_store_codec.h"
#include "../rdf/namespaces.h"
#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <iostream>

namespace slopgraph {
namespace graph {

using rdf::Term;
namespace vocab = rdf::vocab;

// =============================================================================
// Deadline
// =============================================================================

class GraphStore::Deadline {
public:
    explicit Deadline(std::chrono::milliseconds timeout)
        : start_(std::chrono::steady_clock::now())
        , end_(start_ + timeout) {}

    [[nodiscard]] bool expired() const {
        return std::chrono::steady_clock::now() >= end_;
    }

    void check() const {
        if (expired()) throw codec::QueryTimeoutError();
    }

    [[nodiscard]] int64_t elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

// =============================================================================
// Scans
// =============================================================================

std::vector<rdf::Statement> GraphStore::scan(rocksdb::ColumnFamilyHandle* cf,
                                             const std::string& prefix,
                                             const Deadline* deadline) const {
    std::vector<rdf::Statement> statements;

    rocksdb::ReadOptions read_options;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(read_options, cf));

    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (deadline) deadline->check();

        auto decoded = codec::decodeStatement(it->value().ToString());
        if (decoded.isError()) {
            throw codec::StorageScanError(decoded.errorMessage());
        }
        statements.push_back(std::move(decoded).value());
    }

    if (!it->status().ok()) {
        throw codec::StorageScanError(std::format("Iterator failed: {}", it->status().ToString()));
    }
    return statements;
}

std::vector<rdf::Statement> GraphStore::scanSpo(const std::string& prefix, const Deadline* deadline) const {
    return scan(cf_spo_, prefix, deadline);
}

std::vector<rdf::Statement> GraphStore::scanPos(const std::string& prefix, const Deadline* deadline) const {
    return scan(cf_pos_, prefix, deadline);
}

std::vector<Iri> GraphStore::subjectsWithLabel(const std::string& label, const Deadline& deadline) const {
    const bool use_cache = config_.mode == StoreMode::READ_WRITE;
    const uint64_t generation = generation_.load();

    if (use_cache) {
        tbb::concurrent_hash_map<std::string, LabelCacheEntry>::const_accessor accessor;
        if (label_cache_.find(accessor, label)) {
            if (accessor->second.generation == generation) {
                return accessor->second.subjects;
            }
            if (accessor->second.generation < generation) {
                label_cache_.erase(accessor);
            }
        }
    }

    std::vector<Iri> subjects;
    for (auto& statement : scanPos(codec::posPrefix(vocab::RDFS_LABEL, Term::literal(label)), &deadline)) {
        if (std::find(subjects.begin(), subjects.end(), statement.subject) == subjects.end()) {
            subjects.push_back(std::move(statement.subject));
        }
    }

    // Past capacity new labels go uncached until stale entries are erased
    if (use_cache && label_cache_.size() < kLabelCacheCapacity) {
        tbb::concurrent_hash_map<std::string, LabelCacheEntry>::accessor accessor;
        label_cache_.insert(accessor, label);
        // An entry scanned under a newer generation wins
        if (accessor->second.generation <= generation) {
            accessor->second.generation = generation;
            accessor->second.subjects = subjects;
        }
    }

    return subjects;
}

std::set<Iri> GraphStore::documentsDiscussing(const Iri& concept_iri, const Deadline& deadline) const {
    std::set<Iri> documents;
    for (auto& statement : scanPos(codec::posPrefix(vocab::SLOP_DISCUSSES, Term::iri(concept_iri)), &deadline)) {
        documents.insert(std::move(statement.subject));
    }
    return documents;
}

std::optional<std::string> GraphStore::firstObject(const Iri& subject, const Iri& predicate,
                                                   const Deadline& deadline) const {
    auto statements = scanSpo(codec::spoPrefix(subject, predicate), &deadline);
    if (statements.empty()) {
        return std::nullopt;
    }
    return statements.front().object.value;
}

// =============================================================================
// Templates
// =============================================================================

std::vector<Binding> GraphStore::runDocumentsDiscussing(const QueryDescriptor& descriptor,
                                                        const Deadline& deadline) const {
    std::set<Iri> documents;
    for (const auto& concept_iri : subjectsWithLabel(descriptor.concept_label, deadline)) {
        auto discussing = documentsDiscussing(concept_iri, deadline);
        documents.insert(discussing.begin(), discussing.end());
    }

    struct Row {
        Binding binding;
        std::optional<double> confidence;
    };
    std::vector<Row> rows;
    rows.reserve(documents.size());

    for (const auto& doc : documents) {
        Row row;
        row.binding["doc"] = doc;

        if (auto title = firstObject(doc, vocab::DCT_TITLE, deadline)) {
            row.binding["title"] = *title;
        }
        if (auto confidence = firstObject(doc, vocab::SLOP_TYPE_CONFIDENCE, deadline)) {
            row.binding["confidence"] = *confidence;
            char* end = nullptr;
            double value = std::strtod(confidence->c_str(), &end);
            if (end != confidence->c_str()) {
                row.confidence = value;
            }
        }
        if (auto domain = firstObject(doc, vocab::SLOP_PRIMARY_DOMAIN, deadline)) {
            row.binding["domain"] = *domain;
        }
        rows.push_back(std::move(row));
    }

    // Highest confidence first, unscored documents last, ties in IRI order
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        if (a.confidence.has_value() != b.confidence.has_value()) {
            return a.confidence.has_value();
        }
        return a.confidence.value_or(0.0) > b.confidence.value_or(0.0);
    });

    std::vector<Binding> bindings;
    for (size_t i = 0; i < rows.size() && i < descriptor.limit; i++) {
        bindings.push_back(std::move(rows[i].binding));
    }
    return bindings;
}

std::vector<Binding> GraphStore::runCoOccurring(const QueryDescriptor& descriptor,
                                                const Deadline& deadline) const {
    // neighbor label → documents discussing both concepts
    std::map<std::string, std::set<Iri>> shared_documents;

    for (const auto& concept_iri : subjectsWithLabel(descriptor.concept_label, deadline)) {
        auto concept_docs = documentsDiscussing(concept_iri, deadline);
        if (concept_docs.empty()) continue;

        // Edges are stored once per pair, so follow both directions
        std::set<Iri> neighbors;
        for (auto& s : scanSpo(codec::spoPrefix(concept_iri, vocab::SLOP_CO_OCCURS_WITH), &deadline)) {
            if (s.object.isIri()) neighbors.insert(std::move(s.object.value));
        }
        for (auto& s : scanPos(codec::posPrefix(vocab::SLOP_CO_OCCURS_WITH, Term::iri(concept_iri)), &deadline)) {
            neighbors.insert(std::move(s.subject));
        }
        neighbors.erase(concept_iri);

        for (const auto& neighbor : neighbors) {
            auto neighbor_docs = documentsDiscussing(neighbor, deadline);

            std::vector<Iri> joint;
            std::set_intersection(concept_docs.begin(), concept_docs.end(),
                                  neighbor_docs.begin(), neighbor_docs.end(),
                                  std::back_inserter(joint));
            if (joint.empty()) continue;

            for (const auto& label : scanSpo(codec::spoPrefix(neighbor, vocab::RDFS_LABEL), &deadline)) {
                shared_documents[label.object.value].insert(joint.begin(), joint.end());
            }
        }
    }

    std::vector<std::pair<std::string, size_t>> rows;
    rows.reserve(shared_documents.size());
    for (const auto& [label, docs] : shared_documents) {
        rows.emplace_back(label, docs.size());
    }

    // Map order already sorts labels, stable sort keeps it for equal counts
    std::stable_sort(rows.begin(), rows.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<Binding> bindings;
    for (size_t i = 0; i < rows.size() && i < descriptor.limit; i++) {
        bindings.push_back(Binding{
            {"related_concept", rows[i].first},
            {"frequency", std::to_string(rows[i].second)},
        });
    }
    return bindings;
}

std::vector<Binding> GraphStore::runCountByType(const QueryDescriptor& descriptor,
                                                const Deadline& deadline) const {
    auto type_iri = rdf::NamespaceTable::standard().expand(descriptor.type_iri);

    std::set<Iri> subjects;
    for (auto& statement : scanPos(codec::posPrefix(vocab::RDF_TYPE, Term::iri(type_iri.value())), &deadline)) {
        subjects.insert(std::move(statement.subject));
    }

    return {Binding{{"count", std::to_string(subjects.size())}}};
}

// =============================================================================
// Query entry points
// =============================================================================

QueryResult GraphStore::query(const QueryDescriptor& descriptor,
                              std::chrono::milliseconds timeout) const {
    Deadline deadline(timeout);
    QueryResult result;

    auto fail = [&](ErrorCode code, std::string message) {
        result.bindings.clear();
        result.total_results = 0;
        result.error_code = code;
        result.error_message = std::move(message);
        result.elapsed_ms = deadline.elapsedMs();
        std::cerr << std::format("[GraphStore] Query failed ({}): {}",
                                 errorCodeToString(code), result.error_message) << std::endl;
        return result;
    };

    if (!db_) {
        return fail(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    if (descriptor.limit == 0) {
        return fail(ErrorCode::QUERY_INVALID_PARAMS, "Query limit must be positive");
    }
    if (descriptor.kind == QueryTemplate::COUNT_BY_TYPE) {
        if (descriptor.type_iri.empty()) {
            return fail(ErrorCode::QUERY_INVALID_PARAMS, "Type IRI is required");
        }
        auto expanded = rdf::NamespaceTable::standard().expand(descriptor.type_iri);
        if (expanded.isError()) {
            return fail(ErrorCode::QUERY_INVALID_PARAMS, expanded.errorMessage());
        }
    } else if (descriptor.concept_label.empty()) {
        return fail(ErrorCode::QUERY_INVALID_PARAMS, "Concept label is required");
    }

    try {
        deadline.check();

        switch (descriptor.kind) {
            case QueryTemplate::DOCUMENTS_DISCUSSING:
                result.bindings = runDocumentsDiscussing(descriptor, deadline);
                break;
            case QueryTemplate::CO_OCCURRING_CONCEPTS:
                result.bindings = runCoOccurring(descriptor, deadline);
                break;
            case QueryTemplate::COUNT_BY_TYPE:
                result.bindings = runCountByType(descriptor, deadline);
                break;
        }

        // Work finished past the deadline is still a timeout
        deadline.check();

    } catch (const codec::QueryTimeoutError&) {
        return fail(ErrorCode::QUERY_TIMEOUT,
            std::format("Query exceeded {} ms timeout", timeout.count()));
    } catch (const std::exception& e) {
        return fail(ErrorCode::QUERY_EXECUTION_ERROR, e.what());
    }

    result.total_results = result.bindings.size();
    result.elapsed_ms = deadline.elapsedMs();
    return result;
}

QueryResult GraphStore::findRelatedDocuments(const std::string& concept_label, size_t limit,
                                             std::chrono::milliseconds timeout) const {
    return query(QueryDescriptor::documentsDiscussing(concept_label, limit), timeout);
}

QueryResult GraphStore::findCoOccurringConcepts(const std::string& concept_label, size_t limit,
                                                std::chrono::milliseconds timeout) const {
    return query(QueryDescriptor::coOccurring(concept_label, limit), timeout);
}

Result<DocumentStats> GraphStore::getDocumentStats(std::chrono::milliseconds timeout) const {
    DocumentStats stats;

    const std::pair<const char*, size_t*> counters[] = {
        {"slop:Document", &stats.total_documents},
        {"slop:Concept", &stats.total_concepts},
        {"slop:ConversationDocument", &stats.conversations},
        {"slop:MarkdownDocument", &stats.markdown_docs},
    };

    for (const auto& [type, target] : counters) {
        auto result = query(QueryDescriptor::countByType(type), timeout);
        if (!result.ok()) {
            return Result<DocumentStats>(result.error_code, result.error_message);
        }
        *target = std::stoull(result.bindings.front().at("count"));
    }

    return Result<DocumentStats>(stats);
}

// =============================================================================
// Point reads and export
// =============================================================================

Result<std::vector<rdf::Statement>> GraphStore::statementsAbout(const Iri& subject) const {
    if (!db_) {
        return Result<std::vector<rdf::Statement>>(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    try {
        return Result<std::vector<rdf::Statement>>(scanSpo(codec::spoPrefix(subject), nullptr));
    } catch (const std::exception& e) {
        return Result<std::vector<rdf::Statement>>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to read statements of {}: {}", subject, e.what()));
    }
}

Result<size_t> GraphStore::statementCount() const {
    if (!db_) {
        return Result<size_t>(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }

    size_t count = 0;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), cf_spo_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        count++;
    }
    if (!it->status().ok()) {
        return Result<size_t>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to count statements: {}", it->status().ToString()));
    }
    return Result<size_t>(count);
}

std::optional<std::string> GraphStore::exportSubgraph(const Iri& subject) const {
    auto own = statementsAbout(subject);
    if (own.isError()) {
        std::cerr << std::format("[GraphStore] Export failed: {}", own.errorMessage()) << std::endl;
        return std::nullopt;
    }
    if (own.value().empty()) {
        return std::nullopt;
    }

    rdf::StatementSet subgraph;
    subgraph.statements = own.value();

    std::set<Iri> visited;
    for (const auto& statement : own.value()) {
        if (statement.predicate != vocab::SLOP_DISCUSSES || !statement.object.isIri()) continue;
        if (!visited.insert(statement.object.value).second) continue;

        auto about = statementsAbout(statement.object.value);
        if (about.isError()) {
            std::cerr << std::format("[GraphStore] Export failed: {}", about.errorMessage()) << std::endl;
            return std::nullopt;
        }
        subgraph.statements.insert(subgraph.statements.end(),
                                   about.value().begin(), about.value().end());
    }

    return serializer_.serialize(subgraph);
}

} // namespace graph
} // namespace slopgraph
