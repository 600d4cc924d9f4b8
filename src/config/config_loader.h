#pragma once

#include "core/common/types.h"
#include "core/document_processor.h"
#include "core/graph/graph_store.h"
#include "core/ontology/ontology_mapper.h"
#include "ml/span_extraction_client.h"
#include <string>

namespace slopgraph {
namespace config {

// Everything the driver needs to wire the pipeline
struct SystemConfig {
    std::string data_dir{"./data"};
    graph::GraphStoreConfig store;
    ml::ExtractionServiceConfig extraction;
    ontology::MapperConfig mapping;
    ProcessorConfig processing;
};

// Defaults for every section; the store lives under <data_dir>/graph
SystemConfig defaultConfig();

// Load a YAML configuration file, missing keys keep their defaults
//
// CONFIG_NOT_FOUND     file does not exist
// CONFIG_PARSE_ERROR   malformed YAML or a value of the wrong type
// CONFIG_INVALID_VALUE value out of range (mode, window, workers, digest length)
Result<SystemConfig> loadConfig(const std::string& config_path);

// Same as loadConfig, from YAML text
Result<SystemConfig> parseConfig(const std::string& yaml_text);

} // namespace config
} // namespace slopgraph
