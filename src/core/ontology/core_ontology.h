/**
 * @file core_ontology.h
 * @brief Bootstrap ontology loaded into every new read-write store
 */

#pragma once

#include <string>

namespace slopgraph {
namespace ontology {

/**
 * @brief Turtle text declaring the document/concept classes and properties
 */
[[nodiscard]] const std::string& coreOntologyTurtle();

} // namespace ontology
} // namespace slopgraph
