/**
 * @file span_resolver.cpp
 * @brief Span overlap resolution and the standard label tables
 */

#include "span_resolver.h"
#include <algorithm>
#include <iostream>

namespace slopgraph {
namespace extraction {

// =============================================================================
// Label tables
// =============================================================================

const DomainTable& DomainTable::defaults() {
    static const DomainTable table({
        // Computer science
        {"computer_science_concept", "cs"},
        {"algorithm", "cs"},
        {"data_structure", "cs"},
        {"programming_language", "cs"},
        {"software_system", "cs"},
        {"distributed_system", "cs"},
        {"machine_learning_concept", "cs"},

        // Mathematics
        {"mathematics_concept", "math"},
        {"mathematical_theorem", "math"},
        {"statistical_method", "math"},
        {"mathematical_proof", "math"},
        {"equation", "math"},

        // Social sciences
        {"social_science_concept", "social"},
        {"research_method", "social"},
        {"psychological_concept", "social"},
        {"economic_concept", "social"},
        {"organizational_behavior", "social"},

        // Philosophy
        {"philosophical_concept", "philosophy"},
        {"ethical_principle", "philosophy"},
        {"logical_argument", "philosophy"},
        {"epistemological_concept", "philosophy"},

        // General
        {"person_mention", "people"},
        {"organization", "entities"},
        {"academic_paper", "references"},
        {"research_finding", "findings"},
        {"methodology", "methods"},
        {"tool", "tools"},
        {"framework", "tools"},
    });
    return table;
}

const std::vector<std::string>& defaultOntologyLabels() {
    static const std::vector<std::string> labels = {
        "computer_science_concept", "algorithm", "data_structure",
        "programming_language", "software_system", "distributed_system",
        "machine_learning_concept",
        "mathematics_concept", "mathematical_theorem", "statistical_method",
        "mathematical_proof", "equation",
        "social_science_concept", "research_method", "psychological_concept",
        "economic_concept", "organizational_behavior",
        "philosophical_concept", "ethical_principle", "logical_argument",
        "epistemological_concept",
        "person_mention", "organization", "academic_paper", "research_finding",
        "methodology", "tool", "framework",
    };
    return labels;
}

// =============================================================================
// SpanResolver
// =============================================================================

SpanResolver::SpanResolver(DomainTable domains)
    : domains_(std::move(domains)) {
}

std::vector<ResolvedConcept> SpanResolver::resolve(std::vector<Span> spans) const {
    std::vector<ResolvedConcept> resolved;
    if (spans.empty()) {
        return resolved;
    }

    std::stable_sort(spans.begin(), spans.end(),
        [](const Span& a, const Span& b) { return a.start < b.start; });

    std::vector<Span> accepted;
    accepted.reserve(spans.size());

    for (auto& candidate : spans) {
        bool beats_all = true;
        bool any_overlap = false;

        for (const auto& existing : accepted) {
            if (!overlaps(candidate, existing)) continue;
            any_overlap = true;
            if (candidate.confidence <= existing.confidence) {
                beats_all = false;
                break;
            }
        }

        if (!any_overlap) {
            accepted.push_back(std::move(candidate));
            continue;
        }
        if (!beats_all) {
            continue;
        }

        // Candidate starts at or after every accepted span, so appending keeps order
        accepted.erase(
            std::remove_if(accepted.begin(), accepted.end(),
                [&candidate](const Span& s) { return overlaps(candidate, s); }),
            accepted.end());
        accepted.push_back(std::move(candidate));
    }

    resolved.reserve(accepted.size());
    for (auto& span : accepted) {
        ResolvedConcept resolved_concept;
        resolved_concept.domain = domains_.domainFor(span.label);
        resolved_concept.span = std::move(span);
        resolved.push_back(std::move(resolved_concept));
    }

    return resolved;
}

std::vector<Span> SpanResolver::filterMalformed(
    std::vector<Span> spans, size_t document_length) {

    std::vector<Span> valid;
    valid.reserve(spans.size());

    const auto limit = static_cast<int64_t>(document_length);
    for (auto& span : spans) {
        if (span.start < 0 || span.start > span.end || span.end > limit) {
            std::cerr << std::format("[SpanResolver] Dropping malformed span '{}' ({}) [{}, {}) "
                                     "for document of length {}",
                                     span.text, span.label, span.start, span.end,
                                     document_length) << std::endl;
            continue;
        }
        valid.push_back(std::move(span));
    }

    return valid;
}

DomainDistribution computeDomainDistribution(const std::vector<ResolvedConcept>& concepts) {
    DomainDistribution distribution;
    for (const auto& item : concepts) {
        auto it = std::find_if(distribution.begin(), distribution.end(),
            [&item](const auto& entry) { return entry.first == item.domain; });
        if (it == distribution.end()) {
            distribution.emplace_back(item.domain, 1);
        } else {
            it->second++;
        }
    }
    return distribution;
}

} // namespace extraction
} // namespace slopgraph
