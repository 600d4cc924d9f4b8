/**
 * @file test_ontology_mapper.cpp
 * @brief Statement construction tests
 */

#include "core/ontology/ontology_mapper.h"
#include "core/ontology/core_ontology.h"
#include "core/rdf/turtle_serializer.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace slopgraph;
using namespace slopgraph::ontology;
using slopgraph::extraction::ResolvedConcept;
using slopgraph::rdf::Statement;
using slopgraph::rdf::Term;

void print_result(const std::string& test_name, bool passed) {
    std::cout << "[" << (passed ? "PASS" : "FAIL") << "] " << test_name << std::endl;
}

static const std::string SLOP = rdf::ns::SLOP;
static const std::string XSD = rdf::ns::XSD;

static ResolvedConcept makeConcept(const std::string& text, const std::string& label,
                                   int64_t start, double confidence, const std::string& domain) {
    ResolvedConcept c;
    c.span.text = text;
    c.span.label = label;
    c.span.start = start;
    c.span.end = start + static_cast<int64_t>(text.size());
    c.span.confidence = confidence;
    c.span.context = "... " + text + " ...";
    c.domain = domain;
    return c;
}

static DocumentMetadata plainMetadata() {
    DocumentMetadata metadata;
    metadata.doc_type = DocumentType::PLAIN_TEXT;
    metadata.confidence = 0.5;
    return metadata;
}

static size_t countWhere(const rdf::StatementSet& set, const std::string& predicate) {
    return static_cast<size_t>(std::count_if(set.statements.begin(), set.statements.end(),
        [&](const Statement& s) { return s.predicate == predicate; }));
}

static bool contains(const rdf::StatementSet& set, const Statement& statement) {
    return std::find(set.statements.begin(), set.statements.end(), statement) != set.statements.end();
}

bool test_document_block() {
    std::cout << "\n=== Testing document block ===" << std::endl;

    OntologyMapper mapper;
    DocumentMetadata metadata;
    metadata.doc_type = DocumentType::MARKDOWN;
    metadata.confidence = 0.75;
    metadata.suggested_title = "Consensus Notes";
    metadata.features["line_count"] = int64_t{12};
    metadata.features["avg_line_length"] = 42.5;
    metadata.features["has_headers"] = true;
    metadata.features["labels"] = std::vector<std::string>{"x"};

    auto set = mapper.map("# Consensus Notes\nRaft", {}, metadata, std::string("/notes/consensus.md"));

    const std::string doc = SLOP + "document/consensus";
    bool iri_ok = set.document_iri && *set.document_iri == doc;
    print_result("Document named after file stem", iri_ok);

    bool types_ok = contains(set, {doc, rdf::vocab::RDF_TYPE, Term::iri(SLOP + "Document")}) &&
                    contains(set, {doc, rdf::vocab::RDF_TYPE, Term::iri(SLOP + "MarkdownDocument")});
    print_result("Generic and specific type statements", types_ok);

    bool confidence_ok = contains(set, {doc, SLOP + "typeConfidence", Term::typed("0.75", XSD + "float")});
    print_result("Type confidence typed float", confidence_ok);

    bool title_ok = contains(set, {doc, std::string(rdf::ns::DCT) + "title", Term::literal("Consensus Notes")});
    print_result("Title literal", title_ok);

    bool features_ok =
        contains(set, {doc, SLOP + "line_count", Term::typed("12", XSD + "integer")}) &&
        contains(set, {doc, SLOP + "avg_line_length", Term::typed("42.5", XSD + "float")}) &&
        contains(set, {doc, SLOP + "has_headers", Term::typed("true", XSD + "boolean")}) &&
        countWhere(set, SLOP + "labels") == 0;
    print_result("Feature datatypes chosen by value type", features_ok);

    bool path_ok = contains(set, {doc, SLOP + "filePath", Term::literal("/notes/consensus.md")});
    print_result("File path literal", path_ok);

    bool counters_ok = set.concepts_mapped == 0 && set.relationships_created == 0;
    print_result("No concepts, no relationships", counters_ok);

    return iri_ok && types_ok && confidence_ok && title_ok && features_ok && path_ok && counters_ok;
}

bool test_concept_block() {
    std::cout << "\n=== Testing concept block ===" << std::endl;

    OntologyMapper mapper;
    std::vector<ResolvedConcept> concepts = {
        makeConcept("Raft", "algorithm", 10, 0.9, "cs"),
        makeConcept("gizmo", "unmapped_label", 300, 0.4, "other"),
    };

    const std::string content = "Raft is a consensus algorithm.";
    auto set = mapper.map(content, concepts, plainMetadata());

    const std::string raft = SLOP + "concept/" + mapper.identity().conceptId("Raft", "algorithm");
    const std::string gizmo = SLOP + "concept/" + mapper.identity().conceptId("gizmo", "unmapped_label");
    const std::string doc = *set.document_iri;

    bool doc_ok = doc == SLOP + "document/" + mapper.identity().documentId(content);
    print_result("Document named by content digest", doc_ok);

    bool raft_ok =
        contains(set, {raft, rdf::vocab::RDF_TYPE, Term::iri(SLOP + "Concept")}) &&
        contains(set, {raft, rdf::vocab::RDF_TYPE, Term::iri("http://cso.kmi.open.ac.uk/Algorithm")}) &&
        contains(set, {raft, rdf::vocab::RDFS_LABEL, Term::literal("Raft")}) &&
        contains(set, {raft, SLOP + "extractionLabel", Term::literal("algorithm")}) &&
        contains(set, {raft, SLOP + "confidence", Term::typed("0.9", XSD + "float")}) &&
        contains(set, {raft, SLOP + "startPosition", Term::typed("10", XSD + "integer")}) &&
        contains(set, {raft, SLOP + "endPosition", Term::typed("14", XSD + "integer")}) &&
        contains(set, {raft, SLOP + "context", Term::literal("... Raft ...")}) &&
        contains(set, {doc, SLOP + "discusses", Term::iri(raft)});
    print_result("Mapped concept statements", raft_ok);

    auto gizmo_types = std::count_if(set.statements.begin(), set.statements.end(),
        [&](const Statement& s) { return s.subject == gizmo && s.predicate == rdf::vocab::RDF_TYPE; });
    bool unmapped_ok = gizmo_types == 1;
    print_result("Unmapped label gets only the generic type", unmapped_ok);

    bool count_ok = set.concepts_mapped == 2;
    print_result("concepts_mapped counts resolved concepts", count_ok);

    return doc_ok && raft_ok && unmapped_ok && count_ok;
}

bool test_cooccurrence_window() {
    std::cout << "\n=== Testing co-occurrence window ===" << std::endl;

    OntologyMapper mapper;
    const std::string co = SLOP + "coOccursWith";

    auto near = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 10, 0.9, "cs"),
        makeConcept("Paxos", "algorithm", 50, 0.8, "cs"),
    }, plainMetadata());
    bool near_ok = countWhere(near, co) == 1;
    print_result("Concepts 40 apart co-occur once", near_ok);

    const std::string raft = SLOP + "concept/" + mapper.identity().conceptId("Raft", "algorithm");
    const std::string paxos = SLOP + "concept/" + mapper.identity().conceptId("Paxos", "algorithm");
    bool direction_ok = contains(near, {raft, co, Term::iri(paxos)});
    print_result("Edge runs from first to second concept", direction_ok);

    auto far = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 10, 0.9, "cs"),
        makeConcept("Paxos", "algorithm", 500, 0.8, "cs"),
    }, plainMetadata());
    bool far_ok = countWhere(far, co) == 0;
    print_result("Concepts 490 apart do not co-occur", far_ok);

    auto boundary = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 0, 0.9, "cs"),
        makeConcept("Paxos", "algorithm", 100, 0.8, "cs"),
    }, plainMetadata());
    bool boundary_ok = countWhere(boundary, co) == 0;
    print_result("Window is exclusive", boundary_ok);

    OntologyMapper wide(MapperConfig{1000, identity::kDefaultDigestHexLength});
    auto wide_set = wide.map("doc", {
        makeConcept("Raft", "algorithm", 10, 0.9, "cs"),
        makeConcept("Paxos", "algorithm", 500, 0.8, "cs"),
    }, plainMetadata());
    bool config_ok = countWhere(wide_set, co) == 1;
    print_result("Window is configurable", config_ok);

    return near_ok && direction_ok && far_ok && boundary_ok && config_ok;
}

bool test_domain_aggregates() {
    std::cout << "\n=== Testing domain aggregates ===" << std::endl;

    OntologyMapper mapper;
    auto set = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 0, 0.9, "cs"),
        makeConcept("Python", "programming_language", 200, 0.9, "cs"),
        makeConcept("Bayes", "statistical_method", 400, 0.8, "math"),
    }, plainMetadata());
    const std::string doc = *set.document_iri;

    bool covers_ok = contains(set, {doc, SLOP + "coversCs", Term::typed(std::format("{}", 2.0 / 3.0), XSD + "float")}) &&
                     contains(set, {doc, SLOP + "coversMath", Term::typed(std::format("{}", 1.0 / 3.0), XSD + "float")});
    print_result("Per-domain share statements", covers_ok);

    bool primary_ok = contains(set, {doc, SLOP + "primaryDomain", Term::literal("cs")});
    print_result("Primary domain above one half", primary_ok);

    // 2 covers + 1 primary, no co-occurrences (all 200 apart)
    bool relationships_ok = set.relationships_created == 3;
    print_result("relationships_created counts aggregates", relationships_ok);

    auto even = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 0, 0.9, "cs"),
        makeConcept("Bayes", "statistical_method", 20, 0.8, "math"),
    }, plainMetadata());
    bool no_primary_ok = countWhere(even, SLOP + "primaryDomain") == 0 &&
                         even.relationships_created == 3;  // 1 edge + 2 covers
    print_result("No primary domain at exactly one half", no_primary_ok);

    return covers_ok && primary_ok && relationships_ok && no_primary_ok;
}

bool test_domain_shares_sum_to_one() {
    std::cout << "\n=== Testing domain share totals ===" << std::endl;

    OntologyMapper mapper;
    const std::vector<std::vector<std::string>> distributions = {
        {"cs"},
        {"cs", "cs", "math"},
        {"cs", "math", "physics"},
        {"cs", "cs", "cs", "math", "math", "biology", "biology"},
        {"cs", "math", "physics", "biology", "chemistry", "medicine", "general"},
    };

    bool ok = true;
    for (const auto& domains : distributions) {
        std::vector<ResolvedConcept> concepts;
        for (size_t i = 0; i < domains.size(); i++) {
            concepts.push_back(makeConcept(std::format("concept{}", i), "algorithm",
                                           static_cast<int64_t>(i) * 200, 0.9, domains[i]));
        }
        auto set = mapper.map("doc", concepts, plainMetadata());

        double sum = 0.0;
        size_t covers = 0;
        for (const auto& s : set.statements) {
            if (s.predicate.starts_with(SLOP + "covers")) {
                sum += std::stod(s.object.value);
                covers++;
            }
        }
        bool case_ok = std::abs(sum - 1.0) < 1e-9 && covers > 0;
        print_result(std::format("Shares of {} concepts over {} domains sum to 1", domains.size(), covers), case_ok);
        ok = ok && case_ok;
    }
    return ok;
}

bool test_repeated_mentions() {
    std::cout << "\n=== Testing repeated mentions of one concept ===" << std::endl;

    OntologyMapper mapper;
    const std::string co = SLOP + "coOccursWith";
    auto set = mapper.map("doc", {
        makeConcept("Raft", "algorithm", 0, 0.9, "cs"),
        makeConcept("Paxos", "algorithm", 20, 0.8, "cs"),
        makeConcept("Raft", "algorithm", 40, 0.7, "cs"),
    }, plainMetadata());

    const std::string raft = SLOP + "concept/" + mapper.identity().conceptId("Raft", "algorithm");
    const std::string paxos = SLOP + "concept/" + mapper.identity().conceptId("Paxos", "algorithm");

    bool no_self_ok = !contains(set, {raft, co, Term::iri(raft)});
    print_result("No self edge between two mentions", no_self_ok);

    // Raft->Paxos and Paxos->Raft, plus one covers statement and the primary domain
    bool edges_ok = countWhere(set, co) == 2 && contains(set, {raft, co, Term::iri(paxos)}) &&
                    contains(set, {paxos, co, Term::iri(raft)}) && set.relationships_created == 4;
    print_result("Remaining pairs each give one edge", edges_ok);

    return no_self_ok && edges_ok;
}

bool test_shared_concepts_and_drops() {
    std::cout << "\n=== Testing shared concept nodes and dropped statements ===" << std::endl;

    OntologyMapper mapper;
    auto first = mapper.map("first document", {makeConcept("Raft", "algorithm", 0, 0.9, "cs")}, plainMetadata());
    auto second = mapper.map("second document", {makeConcept("Raft", "algorithm", 7, 0.3, "cs")}, plainMetadata());

    auto discussed = [](const rdf::StatementSet& set) {
        for (const auto& s : set.statements) {
            if (s.predicate == SLOP + "discusses") return s.object.value;
        }
        return std::string();
    };
    bool shared_ok = !discussed(first).empty() && discussed(first) == discussed(second) &&
                     *first.document_iri != *second.document_iri;
    print_result("Same concept in two documents is one node", shared_ok);

    auto classes = defaultConceptClasses();
    classes["algorithm"] = "bogus:Algorithm";
    OntologyMapper broken(MapperConfig{}, rdf::NamespaceTable::standard(), classes);
    auto set = broken.map("doc", {makeConcept("Raft", "algorithm", 0, 0.9, "cs")}, plainMetadata());
    bool dropped_ok = countWhere(set, rdf::vocab::RDFS_LABEL) == 1 &&
                      std::none_of(set.statements.begin(), set.statements.end(),
                          [](const Statement& s) { return s.object.value.find("bogus") != std::string::npos; });
    print_result("Unknown prefix drops only that statement", dropped_ok);

    return shared_ok && dropped_ok;
}

bool test_core_ontology_parses() {
    std::cout << "\n=== Testing bootstrap ontology ===" << std::endl;

    rdf::TurtleSerializer serializer;
    auto parsed = serializer.parse(coreOntologyTurtle());
    bool parse_ok = parsed.isOk();
    print_result("Bootstrap ontology parses", parse_ok);
    if (!parse_ok) {
        std::cerr << parsed.errorMessage() << std::endl;
        return false;
    }

    const auto& statements = parsed.value().statements;
    auto is_class = [&](const std::string& local) {
        Statement s{SLOP + local, rdf::vocab::RDF_TYPE, Term::iri(rdf::vocab::OWL_CLASS)};
        return std::find(statements.begin(), statements.end(), s) != statements.end();
    };
    bool classes_ok = is_class("Document") && is_class("ConversationDocument") &&
                      is_class("MarkdownDocument") && is_class("PlainTextDocument") &&
                      is_class("StructuredDocument") && is_class("RandomDocument") &&
                      is_class("Concept");
    print_result("Document and concept classes declared", classes_ok);

    return classes_ok;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Ontology Mapper Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 8;

    if (test_document_block()) passed++;
    if (test_concept_block()) passed++;
    if (test_cooccurrence_window()) passed++;
    if (test_domain_aggregates()) passed++;
    if (test_domain_shares_sum_to_one()) passed++;
    if (test_repeated_mentions()) passed++;
    if (test_shared_concepts_and_drops()) passed++;
    if (test_core_ontology_parses()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
