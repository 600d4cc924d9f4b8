/**
 * @file turtle_serializer.h
 * @brief Turtle text serialization of statement sets
 */

#pragma once

#include "namespaces.h"
#include "statement.h"
#include <string>
#include <string_view>

namespace slopgraph {
namespace rdf {

/**
 * @brief Serializes statement sets to Turtle and parses a Turtle subset back
 *
 * Output groups statements by subject in first-seen order; each block
 * chains its predicate/object pairs with ';' and closes with '.'.
 * IRIs are written in prefixed form when a bound namespace matches and
 * in <...> form otherwise.
 *
 * The parser accepts @prefix / PREFIX directives, comments, the 'a'
 * keyword, ';' and ',' lists, quoted and typed literals, and bare
 * numeric / boolean literals. Blank nodes, collections, @base and
 * language tags are rejected.
 */
class TurtleSerializer {
public:
    explicit TurtleSerializer(NamespaceTable namespaces = NamespaceTable::standard());

    /**
     * @brief Render a statement set
     *
     * Prefixes come from the serializer's table followed by any extra
     * bindings carried by the set.
     */
    [[nodiscard]] std::string serialize(const StatementSet& statements) const;

    /**
     * @brief Parse Turtle text into full-IRI statements
     * @return statements, or STORAGE_SERIALIZATION_ERROR with the failing line
     */
    [[nodiscard]] Result<StatementSet> parse(std::string_view text) const;

    /**
     * @brief Escape a literal for inclusion between double quotes
     */
    [[nodiscard]] static std::string escapeLiteral(std::string_view value);

    [[nodiscard]] const NamespaceTable& namespaces() const noexcept { return namespaces_; }

private:
    [[nodiscard]] std::string formatIri(const NamespaceTable& table, const Iri& iri) const;
    [[nodiscard]] std::string formatObject(const NamespaceTable& table, const Term& term) const;

    NamespaceTable namespaces_;
};

} // namespace rdf
} // namespace slopgraph
