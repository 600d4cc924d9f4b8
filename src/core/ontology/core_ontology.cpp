/**
 * @file core_ontology.cpp
 * @brief Core class and property declarations
 */

#include "core_ontology.h"

namespace slopgraph {
namespace ontology {

const std::string& coreOntologyTurtle() {
    static const std::string turtle = R"TTL(
@prefix slop: <http://slop.at/ontology#> .
@prefix rdf: <http://www.w3.org/1999/02/22-rdf-syntax-ns#> .
@prefix rdfs: <http://www.w3.org/2000/01/rdf-schema#> .
@prefix owl: <http://www.w3.org/2002/07/owl#> .
@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .

# Classes
slop:Document a owl:Class ;
    rdfs:label "Document" ;
    rdfs:comment "A document or conversation" .

slop:ConversationDocument a owl:Class ;
    rdfs:subClassOf slop:Document ;
    rdfs:label "Conversation Document" .

slop:MarkdownDocument a owl:Class ;
    rdfs:subClassOf slop:Document ;
    rdfs:label "Markdown Document" .

slop:PlainTextDocument a owl:Class ;
    rdfs:subClassOf slop:Document ;
    rdfs:label "Plain Text Document" .

slop:StructuredDocument a owl:Class ;
    rdfs:subClassOf slop:Document ;
    rdfs:label "Structured Document" .

slop:RandomDocument a owl:Class ;
    rdfs:subClassOf slop:Document ;
    rdfs:label "Unclassified Document" .

slop:Concept a owl:Class ;
    rdfs:label "Concept" ;
    rdfs:comment "A concept extracted from a document" .

# Object properties
slop:discusses a owl:ObjectProperty ;
    rdfs:domain slop:Document ;
    rdfs:range slop:Concept ;
    rdfs:label "discusses" .

slop:coOccursWith a owl:ObjectProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range slop:Concept ;
    rdfs:label "co-occurs with" .

# Datatype properties
slop:typeConfidence a owl:DatatypeProperty ;
    rdfs:domain slop:Document ;
    rdfs:range xsd:float ;
    rdfs:label "type confidence" .

slop:confidence a owl:DatatypeProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range xsd:float ;
    rdfs:label "confidence" .

slop:extractionLabel a owl:DatatypeProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range xsd:string ;
    rdfs:label "extraction label" .

slop:context a owl:DatatypeProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range xsd:string ;
    rdfs:label "context" .

slop:startPosition a owl:DatatypeProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range xsd:integer ;
    rdfs:label "start position" .

slop:endPosition a owl:DatatypeProperty ;
    rdfs:domain slop:Concept ;
    rdfs:range xsd:integer ;
    rdfs:label "end position" .

slop:primaryDomain a owl:DatatypeProperty ;
    rdfs:domain slop:Document ;
    rdfs:range xsd:string ;
    rdfs:label "primary domain" .

slop:filePath a owl:DatatypeProperty ;
    rdfs:domain slop:Document ;
    rdfs:range xsd:string ;
    rdfs:label "file path" .
)TTL";
    return turtle;
}

} // namespace ontology
} // namespace slopgraph
