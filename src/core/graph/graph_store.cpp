/**
 * @file graph_store.cpp
 * @brief Store lifecycle and write path
 */

#include "graph_store.h"
#include "graph_store_codec.h"
#include "../ontology/core_ontology.h"
#include <rocksdb/cache.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>
#include <filesystem>
#include <functional>
#include <iostream>

namespace slopgraph {
namespace graph {

namespace {

constexpr const char* kCfSpo = "spo";
constexpr const char* kCfPos = "pos";

constexpr const char* kFormatVersionKey = "format_version";
constexpr const char* kFormatVersion = "1";

std::atomic<uint64_t> secondary_counter{0};

// RocksDB reports both cross-process and in-process LOCK contention as IOError
bool isLockContention(const rocksdb::Status& status) {
    if (status.IsBusy() || status.IsTimedOut()) {
        return true;
    }
    if (!status.IsIOError()) {
        return false;
    }
    auto text = status.ToString();
    return text.find("lock") != std::string::npos || text.find("LOCK") != std::string::npos;
}

std::vector<rocksdb::ColumnFamilyDescriptor> columnFamilies(const rocksdb::ColumnFamilyOptions& options) {
    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.emplace_back(rocksdb::kDefaultColumnFamilyName, options);
    descriptors.emplace_back(kCfSpo, options);
    descriptors.emplace_back(kCfPos, options);
    return descriptors;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

GraphStore::GraphStore(GraphStoreConfig config)
    : config_(std::move(config)) {
}

GraphStore::~GraphStore() {
    close();
}

// =============================================================================
// Open and close
// =============================================================================

Result<bool> GraphStore::open() {
    if (db_) {
        return Result<bool>(true);
    }
    if (config_.storage_location.empty()) {
        return Result<bool>(ErrorCode::INVALID_ARGUMENT, "Storage location is empty");
    }

    try {
        auto result = config_.mode == StoreMode::READ_WRITE ? openReadWrite() : openReadOnly();
        if (result.isOk()) {
            std::cout << std::format("[GraphStore] Opened {} ({})",
                                     config_.storage_location, storeModeToString(config_.mode)) << std::endl;
        }
        return result;

    } catch (const std::exception& e) {
        close();
        return Result<bool>(ErrorCode::INTERNAL_ERROR,
            std::format("Failed to open store: {}", e.what()));
    }
}

Result<bool> GraphStore::openReadWrite() {
    std::filesystem::create_directories(config_.storage_location);

    rocksdb::Options options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.max_open_files = config_.max_open_files;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.cache_size_mb * 1024 * 1024);
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(rocksdb::DBOptions(options), config_.storage_location,
                                    columnFamilies(rocksdb::ColumnFamilyOptions(options)),
                                    &handles, &raw_db);

    if (!status.ok()) {
        if (isLockContention(status)) {
            return Result<bool>(ErrorCode::STORE_LOCKED,
                std::format("Store {} is locked by another read-write handle: {}",
                            config_.storage_location, status.ToString()));
        }
        return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to open database: {}", status.ToString()));
    }

    db_.reset(raw_db);
    cf_default_ = handles[0];
    cf_spo_ = handles[1];
    cf_pos_ = handles[2];

    auto bootstrap = bootstrapIfEmpty();
    if (bootstrap.isError()) {
        std::cerr << std::format("[GraphStore] Bootstrap failed: {}", bootstrap.errorMessage()) << std::endl;
        close();
        return bootstrap;
    }
    return Result<bool>(true);
}

Result<bool> GraphStore::openReadOnly() {
    namespace fs = std::filesystem;

    if (!fs::exists(fs::path(config_.storage_location) / "CURRENT")) {
        return Result<bool>(ErrorCode::STORAGE_NOT_FOUND,
            std::format("No store at {}", config_.storage_location));
    }

    secondary_path_ = config_.secondary_path;
    if (secondary_path_.empty()) {
        secondary_path_ = (fs::temp_directory_path() / std::format("slopgraph-ro-{:x}-{}-{}",
            std::hash<std::string>{}(config_.storage_location), nowMillis(),
            secondary_counter.fetch_add(1))).string();
    }
    fs::create_directories(secondary_path_);

    rocksdb::Options options;
    options.max_open_files = -1;  // required for secondary instances

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::OpenAsSecondary(rocksdb::DBOptions(options), config_.storage_location,
                                               secondary_path_,
                                               columnFamilies(rocksdb::ColumnFamilyOptions(options)),
                                               &handles, &raw_db);
    if (!status.ok()) {
        return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to open read-only handle: {}", status.ToString()));
    }

    db_.reset(raw_db);
    cf_default_ = handles[0];
    cf_spo_ = handles[1];
    cf_pos_ = handles[2];
    return Result<bool>(true);
}

void GraphStore::close() {
    if (!db_) return;

    if (config_.mode == StoreMode::READ_WRITE) {
        auto status = db_->Flush(rocksdb::FlushOptions(), {cf_spo_, cf_pos_});
        if (!status.ok()) {
            std::cerr << std::format("[GraphStore] Flush on close failed: {}", status.ToString()) << std::endl;
        }
    }

    for (auto* handle : {cf_default_, cf_spo_, cf_pos_}) {
        if (handle) {
            auto status = db_->DestroyColumnFamilyHandle(handle);
            if (!status.ok()) {
                std::cerr << std::format("[GraphStore] Releasing column family failed: {}",
                                         status.ToString()) << std::endl;
            }
        }
    }
    cf_default_ = nullptr;
    cf_spo_ = nullptr;
    cf_pos_ = nullptr;

    auto status = db_->Close();
    if (!status.ok()) {
        std::cerr << std::format("[GraphStore] Close failed: {}", status.ToString()) << std::endl;
    }
    db_.reset();
    // Another writer may change the store before a reopen
    generation_.fetch_add(1);

    // Scratch directory of a secondary we created ourselves
    if (!secondary_path_.empty() && config_.secondary_path.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(secondary_path_, ec);
        if (ec) {
            std::cerr << std::format("[GraphStore] Could not remove {}: {}",
                                     secondary_path_, ec.message()) << std::endl;
        }
    }
    secondary_path_.clear();
}

// =============================================================================
// Bootstrap
// =============================================================================

Result<bool> GraphStore::bootstrapIfEmpty() {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), cf_spo_));
    it->SeekToFirst();
    if (!it->status().ok()) {
        return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to inspect store: {}", it->status().ToString()));
    }

    if (it->Valid()) {
        std::string version;
        auto status = db_->Get(rocksdb::ReadOptions(), cf_default_, kFormatVersionKey, &version);
        if (status.ok() && version != kFormatVersion) {
            return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
                std::format("Unsupported store format version {}", version));
        }
        if (!status.ok() && !status.IsNotFound()) {
            return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
                std::format("Failed to read format version: {}", status.ToString()));
        }
        return Result<bool>(true);
    }

    std::cout << "[GraphStore] Empty store, loading core ontology" << std::endl;
    return loadBootstrap();
}

Result<bool> GraphStore::loadBootstrap() {
    auto parsed = serializer_.parse(ontology::coreOntologyTurtle());
    if (parsed.isError()) {
        return Result<bool>(ErrorCode::STORAGE_SERIALIZATION_ERROR,
            std::format("Core ontology is invalid: {}", parsed.errorMessage()));
    }

    auto written = writeStatements(parsed.value().statements);
    if (written.isError()) {
        return Result<bool>(written.errorCode(), written.errorMessage());
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = config_.sync_writes;
    auto status = db_->Put(write_options, cf_default_, kFormatVersionKey, kFormatVersion);
    if (!status.ok()) {
        return Result<bool>(ErrorCode::STORAGE_WRITE_ERROR,
            std::format("Failed to record format version: {}", status.ToString()));
    }

    std::cout << std::format("[GraphStore] Core ontology loaded ({} statements)",
                             written.value().written) << std::endl;
    return Result<bool>(true);
}

// =============================================================================
// Writes
// =============================================================================

Result<InsertStats> GraphStore::insert(const rdf::StatementSet& statements) {
    if (!db_) {
        return Result<InsertStats>(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    if (config_.mode == StoreMode::READ_ONLY) {
        return Result<InsertStats>(ErrorCode::STORE_READ_ONLY, "Store handle is read-only");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::vector<rdf::Statement> valid;
    valid.reserve(statements.size());
    size_t skipped = 0;

    for (const auto& statement : statements.statements) {
        auto reason = codec::validateStatement(statement);
        if (!reason.empty()) {
            std::cerr << std::format("[GraphStore] Skipping statement: {}", reason) << std::endl;
            skipped++;
            continue;
        }
        valid.push_back(statement);
    }

    auto result = writeStatements(valid);
    if (result.isError()) {
        return result;
    }

    auto stats = result.value();
    stats.skipped = skipped;
    return Result<InsertStats>(stats);
}

Result<InsertStats> GraphStore::writeStatements(const std::vector<rdf::Statement>& statements) {
    rocksdb::WriteBatch batch;

    for (const auto& statement : statements) {
        auto value = codec::encodeStatement(statement);
        auto status = batch.Put(cf_spo_, codec::spoKey(statement), value);
        if (status.ok()) {
            status = batch.Put(cf_pos_, codec::posKey(statement), value);
        }
        if (!status.ok()) {
            return Result<InsertStats>(ErrorCode::STORAGE_WRITE_ERROR,
                std::format("Failed to stage statement: {}", status.ToString()));
        }
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = config_.sync_writes;
    auto status = db_->Write(write_options, &batch);

    if (!status.ok()) {
        std::cerr << std::format("[GraphStore] Batch write of {} statements failed: {}",
                                 statements.size(), status.ToString()) << std::endl;
        return Result<InsertStats>(ErrorCode::STORAGE_WRITE_ERROR,
            std::format("Batch write failed: {}", status.ToString()));
    }

    generation_.fetch_add(1);

    InsertStats stats;
    stats.written = statements.size();
    return Result<InsertStats>(stats);
}

Result<bool> GraphStore::clear() {
    if (!db_) {
        return Result<bool>(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    if (config_.mode == StoreMode::READ_ONLY) {
        return Result<bool>(ErrorCode::STORE_READ_ONLY, "Store handle is read-only");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    rocksdb::WriteBatch batch;
    size_t removed = 0;

    for (auto* cf : {cf_spo_, cf_pos_}) {
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), cf));
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            auto status = batch.Delete(cf, it->key());
            if (!status.ok()) {
                return Result<bool>(ErrorCode::STORAGE_WRITE_ERROR,
                    std::format("Failed to stage delete: {}", status.ToString()));
            }
            if (cf == cf_spo_) removed++;
        }
        if (!it->status().ok()) {
            return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
                std::format("Failed to scan store: {}", it->status().ToString()));
        }
    }

    auto status = db_->Write(rocksdb::WriteOptions(), &batch);
    if (!status.ok()) {
        return Result<bool>(ErrorCode::STORAGE_WRITE_ERROR,
            std::format("Failed to clear store: {}", status.ToString()));
    }

    generation_.fetch_add(1);

    std::cout << std::format("[GraphStore] Cleared {} statements", removed) << std::endl;
    return loadBootstrap();
}

Result<bool> GraphStore::refresh() {
    if (!db_) {
        return Result<bool>(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    if (config_.mode == StoreMode::READ_WRITE) {
        return Result<bool>(true);
    }

    auto status = db_->TryCatchUpWithPrimary();
    if (!status.ok()) {
        return Result<bool>(ErrorCode::STORAGE_READ_ERROR,
            std::format("Failed to catch up with writer: {}", status.ToString()));
    }
    return Result<bool>(true);
}

} // namespace graph
} // namespace slopgraph
