/**
 * @file span_resolver.h
 * @brief Overlap resolution for extracted spans
 */

#pragma once

#include "span.h"
#include <vector>

namespace slopgraph {
namespace extraction {

/**
 * @brief Deduplicates overlapping spans by confidence
 *
 * Spans are walked in start order. A candidate that overlaps accepted
 * spans replaces them only when its confidence is strictly higher than
 * every one of them; ties keep the span accepted first. The result never
 * contains two overlapping spans and stays sorted by start offset.
 *
 * Stateless apart from the immutable domain table, safe to share across
 * threads.
 */
class SpanResolver {
public:
    explicit SpanResolver(DomainTable domains = DomainTable::defaults());

    /**
     * @brief Resolve overlaps and attach domains
     * @param spans candidate spans, any order
     * @return surviving concepts sorted by start offset
     */
    [[nodiscard]] std::vector<ResolvedConcept> resolve(std::vector<Span> spans) const;

    /**
     * @brief Drop spans with inverted or out-of-range offsets
     * @param spans raw spans from the extraction service
     * @param document_length length of the extracted text in code points
     * @return well-formed spans in their original order
     */
    [[nodiscard]] static std::vector<Span> filterMalformed(
        std::vector<Span> spans, size_t document_length);

    /**
     * @brief Half-open interval intersection test
     */
    [[nodiscard]] static bool overlaps(const Span& a, const Span& b) noexcept {
        return !(a.end <= b.start || b.end <= a.start);
    }

    [[nodiscard]] const DomainTable& domainTable() const noexcept { return domains_; }

private:
    DomainTable domains_;
};

/**
 * @brief Count resolved concepts per domain, domains in first-seen order
 */
[[nodiscard]] DomainDistribution computeDomainDistribution(
    const std::vector<ResolvedConcept>& concepts);

} // namespace extraction
} // namespace slopgraph
