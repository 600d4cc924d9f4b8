#include <iostream>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config_loader.h"
#include "core/document_processor.h"
#include "core/graph/graph_store.h"
#include "ml/span_extraction_client.h"

namespace slopgraph {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--query <label>] [<file-or-directory>...]" << std::endl;
}

void printRows(const graph::QueryResult& result) {
    if (!result.ok()) {
        std::cerr << "[Query] " << errorCodeToString(result.error_code) << ": " << result.error_message << std::endl;
        return;
    }
    for (const auto& row : result.bindings) {
        std::string line;
        for (const auto& [name, value] : row) {
            if (!line.empty()) line += "  ";
            line += name + "=" + value;
        }
        std::cout << "  " << line << std::endl;
    }
    std::cout << "  (" << result.total_results << " rows, " << result.elapsed_ms << " ms)" << std::endl;
}

} // namespace slopgraph

int main(int argc, char* argv[]) {
    using namespace slopgraph;

    std::cout << R"(
╔══════════════════════════════════════════════════════════════╗
║         slopgraph semantic document graph v1.0.0             ║
╚══════════════════════════════════════════════════════════════╝
)" << std::endl;

    // Command line
    std::string config_path = "config/config.yaml";
    std::vector<std::string> queries;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--query" || arg == "-q") && i + 1 < argc) {
            queries.push_back(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            inputs.push_back(arg);
        }
    }

    // Configuration
    config::SystemConfig system_config;
    auto loaded = config::loadConfig(config_path);
    if (loaded.isOk()) {
        system_config = loaded.value();
    } else if (loaded.errorCode() == ErrorCode::CONFIG_NOT_FOUND) {
        std::cerr << "[Warning] " << loaded.errorMessage() << ", using default configuration" << std::endl;
        system_config = config::defaultConfig();
    } else {
        std::cerr << "[Fatal Error] " << loaded.errorMessage() << std::endl;
        return 1;
    }

    std::cout << "[Config] Data directory: " << system_config.data_dir << std::endl;
    std::cout << "[Config] Store: " << system_config.store.storage_location
              << " (" << graph::storeModeToString(system_config.store.mode) << ")" << std::endl;
    std::cout << "[Config] Extraction service: " << system_config.extraction.endpoint << std::endl;

    // Store
    std::cout << "[Init] Opening graph store..." << std::endl;
    graph::GraphStore store(system_config.store);
    auto opened = store.open();
    if (opened.isError()) {
        std::cerr << "[Fatal Error] " << errorCodeToString(opened.errorCode()) << ": "
                  << opened.errorMessage() << std::endl;
        return 1;
    }

    // Extraction service
    std::cout << "[Init] Connecting to extraction service..." << std::endl;
    auto client = std::make_unique<ml::SpanExtractionClient>(system_config.extraction);
    if (client->healthCheck()) {
        std::cout << "[Init] Extraction service connected" << std::endl;
    } else if (!inputs.empty()) {
        std::cout << "[Warning] Extraction service not available, ingestion will fail" << std::endl;
    }

    DocumentProcessor processor(store, std::move(client), system_config.processing, system_config.mapping);

    // Ingestion
    int failures = 0;
    if (!inputs.empty() && store.mode() == graph::StoreMode::READ_ONLY) {
        std::cerr << "[Error] Store opened read-only, skipping " << inputs.size() << " inputs" << std::endl;
        failures += static_cast<int>(inputs.size());
    } else {
        for (const auto& input : inputs) {
            std::error_code ec;
            if (std::filesystem::is_directory(input, ec)) {
                auto batch = processor.batchProcess(input);
                if (batch.isError()) {
                    std::cerr << "[Error] " << batch.errorMessage() << std::endl;
                    failures++;
                } else {
                    failures += static_cast<int>(batch.value().failures.size());
                }
            } else {
                auto result = processor.processFile(input);
                if (result.isError()) {
                    std::cerr << "[Error] " << input << ": " << result.errorMessage() << std::endl;
                    failures++;
                } else {
                    const auto& r = result.value();
                    std::cout << "[Done] " << input << " -> " << r.document_iri << " ("
                              << documentTypeToString(r.doc_metadata.doc_type) << ", "
                              << r.concepts.size() << " concepts, "
                              << r.statements_generated << " statements)" << std::endl;
                }
            }
        }
    }

    // Queries
    for (const auto& label : queries) {
        std::cout << "\n[Query] Documents discussing \"" << label << "\"" << std::endl;
        printRows(processor.findRelatedDocuments(label));
        std::cout << "[Query] Concepts co-occurring with \"" << label << "\"" << std::endl;
        printRows(processor.findCoOccurringConcepts(label));
    }

    // Statistics
    auto stats = processor.getStatistics();
    if (stats.isOk()) {
        std::cout << "\n[Stats] Documents: " << stats.value().total_documents
                  << ", concepts: " << stats.value().total_concepts
                  << ", conversations: " << stats.value().conversations
                  << ", markdown: " << stats.value().markdown_docs << std::endl;
    } else {
        std::cerr << "[Stats] " << stats.errorMessage() << std::endl;
    }

    store.close();
    std::cout << "[Shutdown] Goodbye!" << std::endl;
    return failures == 0 ? 0 : 2;
}
