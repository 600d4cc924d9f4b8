/**
 * @file test_span_resolver.cpp
 * @brief Span overlap resolution tests
 */

#include "core/extraction/span_resolver.h"
#include <iostream>

using namespace slopgraph;
using namespace slopgraph::extraction;

void print_result(const std::string& test_name, bool passed) {
    std::cout << "[" << (passed ? "PASS" : "FAIL") << "] " << test_name << std::endl;
}

static Span makeSpan(const std::string& text, const std::string& label,
                     int64_t start, int64_t end, double confidence) {
    Span span;
    span.text = text;
    span.label = label;
    span.start = start;
    span.end = end;
    span.confidence = confidence;
    return span;
}

static bool noPairOverlaps(const std::vector<ResolvedConcept>& concepts) {
    for (size_t i = 0; i < concepts.size(); i++) {
        for (size_t j = i + 1; j < concepts.size(); j++) {
            if (SpanResolver::overlaps(concepts[i].span, concepts[j].span)) {
                return false;
            }
        }
    }
    return true;
}

// Two algorithms named in a sentence, plus an overlapping weaker reading
bool test_basic_resolution() {
    std::cout << "\n=== Testing basic resolution ===" << std::endl;

    SpanResolver resolver;
    std::vector<Span> spans = {
        makeSpan("Raft", "algorithm", 0, 4, 0.92),
        makeSpan("Paxos", "algorithm", 9, 14, 0.88),
        makeSpan("Raft and", "software_system", 0, 8, 0.40),
    };

    auto concepts = resolver.resolve(spans);

    bool count_ok = concepts.size() == 2;
    print_result("Weaker overlapping span dropped", count_ok);

    bool order_ok = count_ok && concepts[0].text() == "Raft" && concepts[1].text() == "Paxos";
    print_result("Output sorted by start", order_ok);

    bool domain_ok = count_ok && concepts[0].domain == "cs" && concepts[1].domain == "cs";
    print_result("Domains attached", domain_ok);

    return count_ok && order_ok && domain_ok;
}

bool test_higher_confidence_replaces() {
    std::cout << "\n=== Testing replacement by stronger span ===" << std::endl;

    SpanResolver resolver;
    std::vector<Span> spans = {
        makeSpan("neural", "machine_learning_concept", 0, 6, 0.50),
        makeSpan("neural network", "machine_learning_concept", 0, 14, 0.90),
    };

    auto concepts = resolver.resolve(spans);
    bool ok = concepts.size() == 1 && concepts[0].text() == "neural network";
    print_result("Stronger overlapping span wins", ok);
    return ok;
}

bool test_weaker_later_span_dropped() {
    std::cout << "\n=== Testing weaker span sharing a start ===" << std::endl;

    SpanResolver resolver;
    auto concepts = resolver.resolve({
        makeSpan("Raft", "algorithm", 10, 14, 0.9),
        makeSpan("Paxos", "algorithm", 10, 15, 0.6),
    });

    bool ok = concepts.size() == 1 && concepts[0].text() == "Raft" &&
              concepts[0].start() == 10 && concepts[0].end() == 14 &&
              concepts[0].confidence() == 0.9;
    print_result("Only the stronger of two spans at offset 10 survives", ok);
    return ok;
}

bool test_tie_keeps_first() {
    std::cout << "\n=== Testing confidence ties ===" << std::endl;

    SpanResolver resolver;
    std::vector<Span> spans = {
        makeSpan("graph theory", "mathematics_concept", 0, 12, 0.70),
        makeSpan("theory", "philosophical_concept", 6, 12, 0.70),
    };

    auto concepts = resolver.resolve(spans);
    bool ok = concepts.size() == 1 && concepts[0].text() == "graph theory";
    print_result("Tie keeps the earlier accepted span", ok);
    return ok;
}

// Each replacement is judged against the current survivor only
bool test_chained_replacement() {
    std::cout << "\n=== Testing chained replacement ===" << std::endl;

    SpanResolver resolver;
    std::vector<Span> spans = {
        makeSpan("Kant", "person_mention", 0, 4, 0.60),
        makeSpan("ethics", "ethical_principle", 5, 11, 0.95),
        makeSpan("Kant ethics", "philosophical_concept", 0, 11, 0.80),
    };

    auto concepts = resolver.resolve(spans);
    bool chain_ok = concepts.size() == 1 && concepts[0].text() == "ethics";
    print_result("Strongest span survives a replacement chain", chain_ok);

    spans[1].confidence = 0.50;
    auto weaker = resolver.resolve(spans);
    bool wide_ok = weaker.size() == 1 && weaker[0].text() == "Kant ethics";
    print_result("Wide span keeps its place against weaker neighbours", wide_ok);

    return chain_ok && wide_ok && noPairOverlaps(concepts) && noPairOverlaps(weaker);
}

bool test_nested_and_zero_length() {
    std::cout << "\n=== Testing nested and zero-length spans ===" << std::endl;

    SpanResolver resolver;
    std::vector<Span> nested = {
        makeSpan("binary search tree", "data_structure", 0, 18, 0.70),
        makeSpan("search", "algorithm", 7, 13, 0.85),
        makeSpan("tree", "data_structure", 14, 18, 0.60),
    };
    auto concepts = resolver.resolve(nested);
    bool nested_ok = noPairOverlaps(concepts) && concepts.size() == 2 &&
                     concepts[0].text() == "search" && concepts[1].text() == "tree";
    print_result("Nested spans resolve without overlaps", nested_ok);

    std::vector<Span> empty_spans = {
        makeSpan("", "equation", 3, 3, 0.40),
        makeSpan("", "equation", 3, 3, 0.90),
    };
    auto zero = resolver.resolve(empty_spans);
    bool zero_ok = zero.size() == 2;
    print_result("Zero-length spans never overlap", zero_ok);

    bool empty_ok = resolver.resolve({}).empty();
    print_result("Empty input gives empty output", empty_ok);

    return nested_ok && zero_ok && empty_ok;
}

bool test_unknown_label_domain() {
    std::cout << "\n=== Testing domain lookup ===" << std::endl;

    SpanResolver resolver;
    auto concepts = resolver.resolve({makeSpan("widget", "gadget", 0, 6, 0.5)});
    bool other_ok = concepts.size() == 1 && concepts[0].domain == kOtherDomain;
    print_result("Unknown label maps to other", other_ok);

    const auto& table = DomainTable::defaults();
    bool table_ok = table.domainFor("person_mention") == "people" &&
                    table.domainFor("framework") == "tools" &&
                    table.domainFor("equation") == "math" &&
                    table.size() == defaultOntologyLabels().size();
    print_result("Default table covers label vocabulary", table_ok);

    return other_ok && table_ok;
}

bool test_filter_malformed() {
    std::cout << "\n=== Testing malformed span filtering ===" << std::endl;

    std::vector<Span> spans = {
        makeSpan("ok", "tool", 0, 2, 0.5),
        makeSpan("inverted", "tool", 5, 3, 0.5),
        makeSpan("past end", "tool", 8, 12, 0.5),
        makeSpan("negative", "tool", -1, 2, 0.5),
        makeSpan("at end", "tool", 10, 10, 0.5),
    };

    auto valid = SpanResolver::filterMalformed(spans, 10);
    bool ok = valid.size() == 2 && valid[0].text == "ok" && valid[1].text == "at end";
    print_result("Malformed spans dropped", ok);
    return ok;
}

bool test_domain_distribution() {
    std::cout << "\n=== Testing domain distribution ===" << std::endl;

    SpanResolver resolver;
    auto concepts = resolver.resolve({
        makeSpan("Bayes", "statistical_method", 0, 5, 0.8),
        makeSpan("Python", "programming_language", 10, 16, 0.9),
        makeSpan("regression", "statistical_method", 20, 30, 0.7),
    });

    auto distribution = computeDomainDistribution(concepts);
    bool ok = distribution.size() == 2 &&
              distribution[0].first == "math" && distribution[0].second == 2 &&
              distribution[1].first == "cs" && distribution[1].second == 1;
    print_result("Domains counted in first-seen order", ok);
    return ok;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Span Resolver Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 9;

    if (test_basic_resolution()) passed++;
    if (test_higher_confidence_replaces()) passed++;
    if (test_weaker_later_span_dropped()) passed++;
    if (test_tie_keeps_first()) passed++;
    if (test_chained_replacement()) passed++;
    if (test_nested_and_zero_length()) passed++;
    if (test_unknown_label_domain()) passed++;
    if (test_filter_malformed()) passed++;
    if (test_domain_distribution()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
