#include "config_loader.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>

namespace slopgraph {
namespace config {

namespace {

Result<SystemConfig> invalid(std::string message) {
    std::cerr << "[Config] " << message << std::endl;
    return Result<SystemConfig>(ErrorCode::CONFIG_INVALID_VALUE, std::move(message));
}

Result<SystemConfig> fromNode(const YAML::Node& root) {
    SystemConfig config = defaultConfig();

    // System
    if (root["system"]) {
        config.data_dir = root["system"]["data_dir"].as<std::string>(config.data_dir);
    }
    config.store.storage_location = config.data_dir + "/graph";

    // Store
    if (root["store"]) {
        auto store = root["store"];
        config.store.storage_location = store["path"].as<std::string>(config.store.storage_location);

        auto mode = store["mode"].as<std::string>("read_write");
        if (mode == "read_write") {
            config.store.mode = graph::StoreMode::READ_WRITE;
        } else if (mode == "read_only") {
            config.store.mode = graph::StoreMode::READ_ONLY;
        } else {
            return invalid(std::format("Unknown store mode '{}'", mode));
        }

        config.store.cache_size_mb = store["cache_size_mb"].as<size_t>(config.store.cache_size_mb);
        config.store.max_open_files = store["max_open_files"].as<int>(config.store.max_open_files);
        config.store.sync_writes = store["sync_writes"].as<bool>(config.store.sync_writes);
        config.store.secondary_path = store["secondary_path"].as<std::string>(config.store.secondary_path);
    }

    // Extraction service
    if (root["extraction"]) {
        auto extraction = root["extraction"];
        config.extraction.endpoint = extraction["endpoint"].as<std::string>(config.extraction.endpoint);
        config.extraction.timeout_ms = extraction["timeout_ms"].as<int>(config.extraction.timeout_ms);
        config.extraction.threshold = extraction["threshold"].as<double>(config.extraction.threshold);
        config.extraction.context_window =
            extraction["context_window"].as<int64_t>(config.extraction.context_window);

        if (extraction["labels"]) {
            config.extraction.labels.clear();
            for (const auto& label : extraction["labels"]) {
                config.extraction.labels.push_back(label.as<std::string>());
            }
        }
    }

    // Mapping
    if (root["mapping"]) {
        auto mapping = root["mapping"];
        config.mapping.cooccurrence_window =
            mapping["cooccurrence_window"].as<int64_t>(config.mapping.cooccurrence_window);
        config.mapping.digest_hex_length =
            mapping["digest_hex_length"].as<size_t>(config.mapping.digest_hex_length);
    }

    // Processing
    if (root["processing"]) {
        auto processing = root["processing"];
        auto workers = processing["workers"].as<int64_t>(static_cast<int64_t>(config.processing.workers));
        if (workers <= 0) {
            return invalid(std::format("processing.workers must be positive, got {}", workers));
        }
        config.processing.workers = static_cast<size_t>(workers);
        config.processing.file_extension =
            processing["file_pattern"].as<std::string>(config.processing.file_extension);
    }

    // Queries
    if (root["query"]) {
        auto query = root["query"];
        auto timeout = query["timeout_ms"].as<int64_t>(config.processing.query_timeout.count());
        if (timeout < 0) {
            return invalid(std::format("query.timeout_ms must not be negative, got {}", timeout));
        }
        config.processing.query_timeout = std::chrono::milliseconds(timeout);

        auto limit = query["default_limit"].as<int64_t>(static_cast<int64_t>(config.processing.default_limit));
        if (limit <= 0) {
            return invalid(std::format("query.default_limit must be positive, got {}", limit));
        }
        config.processing.default_limit = static_cast<size_t>(limit);
    }

    if (config.store.storage_location.empty()) {
        return invalid("store.path must not be empty");
    }
    if (config.mapping.cooccurrence_window <= 0) {
        return invalid(std::format("mapping.cooccurrence_window must be positive, got {}",
                                   config.mapping.cooccurrence_window));
    }
    if (config.mapping.digest_hex_length < 8 || config.mapping.digest_hex_length > 64) {
        return invalid(std::format("mapping.digest_hex_length must be within 8..64, got {}",
                                   config.mapping.digest_hex_length));
    }
    if (config.extraction.threshold < 0.0 || config.extraction.threshold > 1.0) {
        return invalid(std::format("extraction.threshold must be within 0..1, got {}",
                                   config.extraction.threshold));
    }
    if (config.extraction.context_window < 0) {
        return invalid(std::format("extraction.context_window must not be negative, got {}",
                                   config.extraction.context_window));
    }
    if (config.extraction.labels.empty()) {
        return invalid("extraction.labels must not be empty");
    }

    return Result<SystemConfig>(std::move(config));
}

} // anonymous namespace

SystemConfig defaultConfig() {
    SystemConfig config;
    config.store.storage_location = config.data_dir + "/graph";
    return config;
}

Result<SystemConfig> parseConfig(const std::string& yaml_text) {
    try {
        return fromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<SystemConfig>(ErrorCode::CONFIG_PARSE_ERROR,
            std::format("Failed to parse config: {}", e.what()));
    }
}

Result<SystemConfig> loadConfig(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return Result<SystemConfig>(ErrorCode::CONFIG_NOT_FOUND,
            std::format("Config file not found: {}", config_path));
    }

    try {
        return fromNode(YAML::LoadFile(config_path));
    } catch (const YAML::Exception& e) {
        return Result<SystemConfig>(ErrorCode::CONFIG_PARSE_ERROR,
            std::format("Failed to load config file {}: {}", config_path, e.what()));
    }
}

} // namespace config
} // namespace slopgraph
