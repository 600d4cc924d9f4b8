/**
 * @file ontology_mapper.cpp
 * @brief Statement construction for documents and concepts
 */

#include "ontology_mapper.h"
#include "../extraction/span_resolver.h"
#include <cctype>
#include <iostream>

namespace slopgraph {
namespace ontology {

using rdf::Term;

namespace {

const std::string kXsdFloat = "xsd:float";
const std::string kXsdInteger = "xsd:integer";
const std::string kXsdBoolean = "xsd:boolean";

std::string formatDouble(double value) {
    return std::format("{}", value);
}

} // anonymous namespace

// =============================================================================
// Concept class table
// =============================================================================

const std::unordered_map<std::string, std::string>& defaultConceptClasses() {
    static const std::unordered_map<std::string, std::string> classes = {
        // Computer science
        {"computer_science_concept", "cso:ComputerScience"},
        {"algorithm", "cso:Algorithm"},
        {"data_structure", "cso:DataStructure"},
        {"programming_language", "cso:ProgrammingLanguage"},
        {"software_system", "cso:SoftwareSystem"},
        {"distributed_system", "cso:DistributedSystem"},
        {"machine_learning_concept", "cso:MachineLearning"},

        // Mathematics
        {"mathematics_concept", "msc:Mathematics"},
        {"mathematical_theorem", "msc:Theorem"},
        {"statistical_method", "msc:Statistics"},
        {"mathematical_proof", "msc:Proof"},
        {"equation", "msc:Equation"},

        // Social sciences
        {"social_science_concept", "schema:SocialScience"},
        {"research_method", "schema:ResearchMethod"},
        {"psychological_concept", "schema:Psychology"},
        {"economic_concept", "schema:Economics"},
        {"organizational_behavior", "schema:Organization"},

        // Philosophy
        {"philosophical_concept", "schema:Philosophy"},
        {"ethical_principle", "schema:Ethics"},
        {"logical_argument", "schema:Logic"},
        {"epistemological_concept", "schema:Epistemology"},

        // General
        {"person_mention", "foaf:Person"},
        {"organization", "foaf:Organization"},
        {"academic_paper", "schema:ScholarlyArticle"},
        {"research_finding", "schema:ResearchFindings"},
        {"methodology", "schema:ResearchMethod"},
        {"tool", "schema:SoftwareApplication"},
        {"framework", "schema:SoftwareApplication"},
    };
    return classes;
}

// =============================================================================
// OntologyMapper
// =============================================================================

OntologyMapper::OntologyMapper(
    MapperConfig config,
    rdf::NamespaceTable namespaces,
    std::unordered_map<std::string, std::string> concept_classes)
    : config_(config)
    , namespaces_(std::move(namespaces))
    , concept_classes_(std::move(concept_classes))
    , identity_(config.digest_hex_length) {
}

std::optional<std::string> OntologyMapper::conceptClassFor(const std::string& label) const {
    auto it = concept_classes_.find(label);
    if (it == concept_classes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string OntologyMapper::titleCase(std::string_view word) {
    std::string out;
    out.reserve(word.size());
    bool start_of_word = true;
    for (char c : word) {
        auto u = static_cast<unsigned char>(c);
        if (std::isalpha(u)) {
            out.push_back(static_cast<char>(start_of_word ? std::toupper(u) : std::tolower(u)));
            start_of_word = false;
        } else {
            out.push_back(c);
            start_of_word = true;
        }
    }
    return out;
}

bool OntologyMapper::emit(rdf::StatementSet& out, std::string_view subject,
                          std::string_view predicate, Term object) const {
    auto subject_iri = namespaces_.expand(subject);
    auto predicate_iri = namespaces_.expand(predicate);

    Result<Iri> object_iri = Iri();
    if (object.kind == rdf::TermKind::IRI) {
        object_iri = namespaces_.expand(object.value);
    } else if (object.kind == rdf::TermKind::TYPED_LITERAL) {
        object_iri = namespaces_.expand(object.datatype);
    }

    for (const auto* part : {&subject_iri, &predicate_iri, &object_iri}) {
        if (part->isError()) {
            std::cerr << std::format("[OntologyMapper] Dropping statement ({} {} ...): {}",
                                     subject, predicate, part->errorMessage()) << std::endl;
            return false;
        }
    }

    if (object.kind == rdf::TermKind::IRI) {
        object.value = std::move(object_iri).value();
    } else if (object.kind == rdf::TermKind::TYPED_LITERAL) {
        object.datatype = std::move(object_iri).value();
    }

    out.statements.push_back(rdf::Statement{
        std::move(subject_iri).value(),
        std::move(predicate_iri).value(),
        std::move(object)
    });
    return true;
}

rdf::StatementSet OntologyMapper::map(
    std::string_view content,
    const std::vector<extraction::ResolvedConcept>& concepts,
    const DocumentMetadata& metadata,
    const std::optional<std::string>& source_path) const {

    rdf::StatementSet out;
    out.namespaces = namespaces_.bindings();

    std::optional<std::string> stable_name;
    if (source_path) {
        stable_name = identity::IdentityAssigner::stableNameFromPath(*source_path);
    }
    const std::string doc = identity::IdentityAssigner::documentIri(
        identity_.documentId(content, stable_name));

    auto expanded_doc = namespaces_.expand(doc);
    if (expanded_doc.isOk()) {
        out.document_iri = expanded_doc.value();
    }

    emitDocumentBlock(out, doc, metadata, source_path);
    auto concept_iris = emitConceptBlocks(out, doc, concepts);

    size_t cooccurrences = emitCoOccurrences(out, concepts, concept_iris);
    size_t aggregates = emitDomainAggregates(out, doc, concepts);

    out.concepts_mapped = concepts.size();
    out.relationships_created = cooccurrences + aggregates;
    return out;
}

void OntologyMapper::emitDocumentBlock(rdf::StatementSet& out, const std::string& doc,
                                       const DocumentMetadata& metadata,
                                       const std::optional<std::string>& source_path) const {
    emit(out, doc, "rdf:type", Term::iri("slop:Document"));
    emit(out, doc, "rdf:type", Term::iri("slop:" + documentTypeClassName(metadata.doc_type)));
    emit(out, doc, "slop:typeConfidence", Term::typed(formatDouble(metadata.confidence), kXsdFloat));

    if (metadata.suggested_title && !metadata.suggested_title->empty()) {
        emit(out, doc, "dct:title", Term::literal(*metadata.suggested_title));
    }

    // Numeric and boolean features only, key order
    for (const auto& [key, value] : metadata.features) {
        const std::string predicate = "slop:" + key;
        if (const auto* b = std::get_if<bool>(&value)) {
            emit(out, doc, predicate, Term::typed(*b ? "true" : "false", kXsdBoolean));
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            emit(out, doc, predicate, Term::typed(std::to_string(*i), kXsdInteger));
        } else if (const auto* d = std::get_if<double>(&value)) {
            emit(out, doc, predicate, Term::typed(formatDouble(*d), kXsdFloat));
        }
    }

    if (source_path) {
        emit(out, doc, "slop:filePath", Term::literal(*source_path));
    }
}

std::vector<std::string> OntologyMapper::emitConceptBlocks(
    rdf::StatementSet& out, const std::string& doc,
    const std::vector<extraction::ResolvedConcept>& concepts) const {

    std::vector<std::string> concept_iris;
    concept_iris.reserve(concepts.size());

    for (const auto& item : concepts) {
        const std::string node = identity::IdentityAssigner::conceptIri(
            identity_.conceptId(item.text(), item.label()));
        concept_iris.push_back(node);

        emit(out, node, "rdf:type", Term::iri("slop:Concept"));
        if (auto mapped = conceptClassFor(item.label())) {
            emit(out, node, "rdf:type", Term::iri(*mapped));
        }
        emit(out, node, "rdfs:label", Term::literal(item.text()));
        emit(out, node, "slop:extractionLabel", Term::literal(item.label()));
        emit(out, node, "slop:confidence", Term::typed(formatDouble(item.confidence()), kXsdFloat));
        emit(out, node, "slop:startPosition", Term::typed(std::to_string(item.start()), kXsdInteger));
        emit(out, node, "slop:endPosition", Term::typed(std::to_string(item.end()), kXsdInteger));
        emit(out, node, "slop:context", Term::literal(item.span.context));
        emit(out, doc, "slop:discusses", Term::iri(node));
    }

    return concept_iris;
}

size_t OntologyMapper::emitCoOccurrences(
    rdf::StatementSet& out,
    const std::vector<extraction::ResolvedConcept>& concepts,
    const std::vector<std::string>& concept_iris) const {

    size_t created = 0;
    for (size_t i = 0; i < concepts.size(); i++) {
        for (size_t j = i + 1; j < concepts.size(); j++) {
            int64_t distance = concepts[i].start() - concepts[j].start();
            if (distance < 0) distance = -distance;
            if (distance >= config_.cooccurrence_window) continue;

            // Repeated mentions of one concept share a node, no self edges
            if (concept_iris[i] == concept_iris[j]) continue;

            if (emit(out, concept_iris[i], "slop:coOccursWith", Term::iri(concept_iris[j]))) {
                created++;
            }
        }
    }
    return created;
}

size_t OntologyMapper::emitDomainAggregates(
    rdf::StatementSet& out, const std::string& doc,
    const std::vector<extraction::ResolvedConcept>& concepts) const {

    auto distribution = extraction::computeDomainDistribution(concepts);
    if (distribution.empty()) {
        return 0;
    }

    const auto total = static_cast<double>(concepts.size());
    size_t created = 0;
    std::optional<std::string> primary;

    for (const auto& [domain, count] : distribution) {
        double share = static_cast<double>(count) / total;
        if (emit(out, doc, "slop:covers" + titleCase(domain), Term::typed(formatDouble(share), kXsdFloat))) {
            created++;
        }
        if (share > 0.5) {
            primary = domain;
        }
    }

    if (primary && emit(out, doc, "slop:primaryDomain", Term::literal(*primary))) {
        created++;
    }
    return created;
}

} // namespace ontology
} // namespace slopgraph
