/**
 * @file graph_store.h
 * @brief Persistent statement store with fixed query templates
 *
 * Statements live in RocksDB under two column families: "spo" keyed by
 * subject/predicate/object and "pos" keyed by predicate/object/subject.
 * Both hold the statement as folly JSON so either index can answer a scan
 * on its own.
 */

#pragma once

#include "../common/types.h"
#include "../rdf/statement.h"
#include "../rdf/turtle_serializer.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <tbb/concurrent_hash_map.h>

namespace slopgraph {
namespace graph {

/**
 * @brief How a store handle accesses its storage location
 */
enum class StoreMode : uint8_t {
    READ_WRITE,   // exclusive lock, bootstraps, accepts writes
    READ_ONLY     // lock-free secondary instance, may lag the writer
};

[[nodiscard]] inline std::string storeModeToString(StoreMode mode) {
    return mode == StoreMode::READ_WRITE ? "read_write" : "read_only";
}

/**
 * @brief Store configuration
 */
struct GraphStoreConfig {
    std::string storage_location;             // RocksDB directory
    StoreMode mode = StoreMode::READ_WRITE;
    size_t cache_size_mb = 64;                // block cache size (MB)
    int max_open_files = 1000;                // read-write only, secondaries use -1
    bool sync_writes = false;
    std::string secondary_path;               // read-only scratch dir, temp dir when empty
};

/**
 * @brief Outcome of one insert call
 */
struct InsertStats {
    size_t written = 0;     // statements written (re-inserting is a no-op)
    size_t skipped = 0;     // malformed statements dropped
};

/**
 * @brief Parameterized query templates
 */
enum class QueryTemplate : uint8_t {
    DOCUMENTS_DISCUSSING,     // documents discussing a concept label
    CO_OCCURRING_CONCEPTS,    // neighbor labels by shared documents
    COUNT_BY_TYPE             // distinct subjects of an rdf:type
};

/**
 * @brief Query request
 */
struct QueryDescriptor {
    QueryTemplate kind = QueryTemplate::DOCUMENTS_DISCUSSING;
    std::string concept_label;    // DOCUMENTS_DISCUSSING, CO_OCCURRING_CONCEPTS
    std::string type_iri;         // COUNT_BY_TYPE, full or prefixed
    size_t limit = 10;

    [[nodiscard]] static QueryDescriptor documentsDiscussing(std::string label, size_t limit) {
        return QueryDescriptor{QueryTemplate::DOCUMENTS_DISCUSSING, std::move(label), {}, limit};
    }
    [[nodiscard]] static QueryDescriptor coOccurring(std::string label, size_t limit) {
        return QueryDescriptor{QueryTemplate::CO_OCCURRING_CONCEPTS, std::move(label), {}, limit};
    }
    [[nodiscard]] static QueryDescriptor countByType(std::string type_iri) {
        return QueryDescriptor{QueryTemplate::COUNT_BY_TYPE, {}, std::move(type_iri), 1};
    }
};

/** One result row, variable name → value */
using Binding = std::map<std::string, std::string>;

/**
 * @brief Query outcome; failures carry an error code and empty bindings
 */
struct QueryResult {
    std::vector<Binding> bindings;
    size_t total_results = 0;
    int64_t elapsed_ms = 0;
    ErrorCode error_code = ErrorCode::SUCCESS;
    std::string error_message;

    [[nodiscard]] bool ok() const noexcept { return error_code == ErrorCode::SUCCESS; }
};

/**
 * @brief Store-wide counts
 */
struct DocumentStats {
    size_t total_documents = 0;
    size_t total_concepts = 0;
    size_t conversations = 0;
    size_t markdown_docs = 0;
};

/** Default query timeout */
inline constexpr std::chrono::milliseconds kDefaultQueryTimeout{30000};

/**
 * @brief Statement store
 *
 * One read-write handle per storage location (RocksDB's LOCK file enforces
 * it across processes and within one); any number of read-only handles may
 * run beside it. Inserts and clears on a handle are serialized internally.
 * Queries never take the write mutex.
 */
class GraphStore {
public:
    explicit GraphStore(GraphStoreConfig config);
    ~GraphStore();

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    /**
     * @brief Open the storage location
     *
     * Read-write handles bootstrap the core ontology into an empty store.
     * @return STORE_LOCKED when another read-write handle holds the location,
     *         STORAGE_NOT_FOUND when a read-only handle finds no store,
     *         STORAGE_SERIALIZATION_ERROR when the bootstrap text is invalid
     */
    [[nodiscard]] Result<bool> open();

    /**
     * @brief Release the handle (and the lock, for read-write handles)
     */
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return db_ != nullptr; }
    [[nodiscard]] StoreMode mode() const noexcept { return config_.mode; }
    [[nodiscard]] const GraphStoreConfig& config() const noexcept { return config_; }

    // =========================================================================
    // Writes
    // =========================================================================

    /**
     * @brief Insert a statement set
     *
     * Statements with non-absolute or malformed IRIs are skipped and logged.
     * Inserting the same statement again leaves the store unchanged.
     */
    [[nodiscard]] Result<InsertStats> insert(const rdf::StatementSet& statements);

    /**
     * @brief Remove every statement and reload the bootstrap ontology
     */
    [[nodiscard]] Result<bool> clear();

    /**
     * @brief Catch a read-only handle up with the writer (no-op for writers)
     */
    [[nodiscard]] Result<bool> refresh();

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Run a query template
     * @param timeout checked before and during scans; expiry returns
     *        QUERY_TIMEOUT with no partial bindings
     */
    [[nodiscard]] QueryResult query(const QueryDescriptor& descriptor,
                                    std::chrono::milliseconds timeout = kDefaultQueryTimeout) const;

    /**
     * @brief Documents discussing a concept, best type confidence first
     */
    [[nodiscard]] QueryResult findRelatedDocuments(
        const std::string& concept_label, size_t limit = 10,
        std::chrono::milliseconds timeout = kDefaultQueryTimeout) const;

    /**
     * @brief Concepts sharing documents with a concept, most frequent first
     */
    [[nodiscard]] QueryResult findCoOccurringConcepts(
        const std::string& concept_label, size_t limit = 10,
        std::chrono::milliseconds timeout = kDefaultQueryTimeout) const;

    /**
     * @brief Document, concept, conversation and markdown counts
     */
    [[nodiscard]] Result<DocumentStats> getDocumentStats(
        std::chrono::milliseconds timeout = kDefaultQueryTimeout) const;

    /**
     * @brief Turtle text of a subject and every concept it discusses
     * @return nullopt when the subject has no statements or the read fails
     */
    [[nodiscard]] std::optional<std::string> exportSubgraph(const Iri& subject) const;

    /**
     * @brief Statements whose subject is the given IRI
     */
    [[nodiscard]] Result<std::vector<rdf::Statement>> statementsAbout(const Iri& subject) const;

    /**
     * @brief Total number of stored statements, bootstrap included
     */
    [[nodiscard]] Result<size_t> statementCount() const;

    /**
     * @brief Labels currently held in the lookup cache (approximate under load)
     */
    [[nodiscard]] size_t cachedLabelCount() const { return label_cache_.size(); }

    static constexpr size_t kLabelCacheCapacity = 4096;

private:
    class Deadline;

    struct LabelCacheEntry {
        uint64_t generation = 0;
        std::vector<Iri> subjects;
    };

    // Open helpers
    [[nodiscard]] Result<bool> openReadWrite();
    [[nodiscard]] Result<bool> openReadOnly();
    [[nodiscard]] Result<bool> bootstrapIfEmpty();
    [[nodiscard]] Result<bool> loadBootstrap();

    // Write path (caller holds write_mutex_)
    [[nodiscard]] Result<InsertStats> writeStatements(const std::vector<rdf::Statement>& statements);

    // Scans; throw on deadline expiry or storage errors, caught by query()
    std::vector<rdf::Statement> scanSpo(const std::string& prefix, const Deadline* deadline) const;
    std::vector<rdf::Statement> scanPos(const std::string& prefix, const Deadline* deadline) const;
    std::vector<rdf::Statement> scan(rocksdb::ColumnFamilyHandle* cf, const std::string& prefix,
                                     const Deadline* deadline) const;

    std::vector<Iri> subjectsWithLabel(const std::string& label, const Deadline& deadline) const;
    std::set<Iri> documentsDiscussing(const Iri& concept_iri, const Deadline& deadline) const;
    std::optional<std::string> firstObject(const Iri& subject, const Iri& predicate,
                                           const Deadline& deadline) const;

    // Templates
    std::vector<Binding> runDocumentsDiscussing(const QueryDescriptor& descriptor,
                                                const Deadline& deadline) const;
    std::vector<Binding> runCoOccurring(const QueryDescriptor& descriptor,
                                        const Deadline& deadline) const;
    std::vector<Binding> runCountByType(const QueryDescriptor& descriptor,
                                        const Deadline& deadline) const;

    GraphStoreConfig config_;
    std::string secondary_path_;
    std::unique_ptr<rocksdb::DB> db_;
    rocksdb::ColumnFamilyHandle* cf_default_ = nullptr;
    rocksdb::ColumnFamilyHandle* cf_spo_ = nullptr;
    rocksdb::ColumnFamilyHandle* cf_pos_ = nullptr;

    std::mutex write_mutex_;
    std::atomic<uint64_t> generation_{0};

    // Hot label → subject lookups, read-write handles only. Entries go stale
    // by generation and are erased one accessor at a time, never cleared.
    mutable tbb::concurrent_hash_map<std::string, LabelCacheEntry> label_cache_;

    rdf::TurtleSerializer serializer_;
};

} // namespace graph
} // namespace slopgraph
