#pragma once

#include "core/extraction/span_extractor.h"
#include <memory>
#include <string>
#include <vector>

namespace slopgraph {
namespace ml {

// Extraction service connection settings
struct ExtractionServiceConfig {
    std::string endpoint{"http://localhost:8000"};
    int timeout_ms{5000};
    double threshold{0.3};             // minimum model score
    int64_t context_window{50};        // code points either side of a span
    std::vector<std::string> labels{extraction::defaultOntologyLabels()};
};

// HTTP client for the span extraction model
//
// POST <endpoint>/extract {text, labels, threshold}
//   → [{text, label, start, end, score}]
//
// Each request uses its own curl handle, so one client serves many threads.
class SpanExtractionClient : public extraction::SpanExtractor {
public:
    explicit SpanExtractionClient(const ExtractionServiceConfig& config);
    ~SpanExtractionClient() override;

    // GET <endpoint>/health reports {"status": "ok"}
    bool healthCheck() const;

    Result<std::vector<extraction::Span>> extract(const std::string& text) const override;

    // Response body → spans; entries missing a field are dropped
    static Result<std::vector<extraction::Span>> parseResponse(
        const std::string& body, const std::string& text, int64_t context_window);

    const ExtractionServiceConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace ml
} // namespace slopgraph
