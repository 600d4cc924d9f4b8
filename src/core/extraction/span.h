/**
 * @file span.h
 * @brief Extracted span and resolved concept types
 *
 * Spans arrive from the extraction service untrusted: they may overlap,
 * repeat, or carry offsets outside the document.
 */

#pragma once

#include "../common/types.h"
#include <string>
#include <vector>
#include <unordered_map>

namespace slopgraph {
namespace extraction {

/** Domain assigned to labels missing from the domain table */
inline constexpr const char* kOtherDomain = "other";

/**
 * @brief Labeled substring candidate returned by the extraction model
 *
 * Offsets are half-open and counted in Unicode code points.
 */
struct Span {
    std::string text;          // surface text
    std::string label;         // extraction label (e.g. "algorithm")
    int64_t start = 0;         // inclusive
    int64_t end = 0;           // exclusive
    Confidence confidence = 0.0;
    std::string context;       // display-only excerpt around the span
};

/**
 * @brief Span that survived overlap resolution, tagged with its domain
 */
struct ResolvedConcept {
    Span span;
    std::string domain;

    [[nodiscard]] const std::string& text() const noexcept { return span.text; }
    [[nodiscard]] const std::string& label() const noexcept { return span.label; }
    [[nodiscard]] int64_t start() const noexcept { return span.start; }
    [[nodiscard]] int64_t end() const noexcept { return span.end; }
    [[nodiscard]] Confidence confidence() const noexcept { return span.confidence; }
};

/** Per-domain concept counts in first-seen order */
using DomainDistribution = std::vector<std::pair<std::string, size_t>>;

/**
 * @brief Immutable label → domain lookup table
 */
class DomainTable {
public:
    DomainTable() = default;
    explicit DomainTable(std::unordered_map<std::string, std::string> mapping)
        : mapping_(std::move(mapping)) {}

    /**
     * @brief Domain for a label, kOtherDomain when the label is unknown
     */
    [[nodiscard]] std::string domainFor(const std::string& label) const {
        auto it = mapping_.find(label);
        return it == mapping_.end() ? std::string(kOtherDomain) : it->second;
    }

    [[nodiscard]] size_t size() const noexcept { return mapping_.size(); }

    /**
     * @brief Table covering the standard ontology label vocabulary
     */
    [[nodiscard]] static const DomainTable& defaults();

private:
    std::unordered_map<std::string, std::string> mapping_;
};

/**
 * @brief Label vocabulary sent to the extraction model
 */
[[nodiscard]] const std::vector<std::string>& defaultOntologyLabels();

} // namespace extraction
} // namespace slopgraph
