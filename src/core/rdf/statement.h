/**
 * @file statement.h
 * @brief Subject-predicate-object statement model
 */

#pragma once

#include "../common/types.h"
#include <compare>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace slopgraph {
namespace rdf {

/**
 * @brief Kind of an object term
 */
enum class TermKind : uint8_t {
    IRI,            // node reference
    LITERAL,        // plain string
    TYPED_LITERAL   // lexical form plus datatype IRI
};

/**
 * @brief Object position of a statement
 *
 * IRIs are full URIs once a statement leaves the mapper; short forms only
 * appear in serialized text.
 */
struct Term {
    TermKind kind = TermKind::IRI;
    std::string value;        // IRI or lexical form
    Iri datatype;             // TYPED_LITERAL only

    [[nodiscard]] static Term iri(Iri value) {
        return Term{TermKind::IRI, std::move(value), {}};
    }
    [[nodiscard]] static Term literal(std::string value) {
        return Term{TermKind::LITERAL, std::move(value), {}};
    }
    [[nodiscard]] static Term typed(std::string value, Iri datatype) {
        return Term{TermKind::TYPED_LITERAL, std::move(value), std::move(datatype)};
    }

    [[nodiscard]] bool isIri() const noexcept { return kind == TermKind::IRI; }
    [[nodiscard]] bool isLiteral() const noexcept { return kind != TermKind::IRI; }

    auto operator<=>(const Term&) const = default;
};

/**
 * @brief One graph assertion
 */
struct Statement {
    Iri subject;
    Iri predicate;
    Term object;

    auto operator<=>(const Statement&) const = default;
};

/** Ordered prefix → namespace URI bindings */
using NamespaceBindings = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Statements derived from one document processing pass
 */
struct StatementSet {
    std::vector<Statement> statements;
    NamespaceBindings namespaces;          // prefixes used for serialization
    std::optional<Iri> document_iri;       // expanded document node, when built by the mapper
    size_t concepts_mapped = 0;            // resolved concepts mapped
    size_t relationships_created = 0;      // co-occurrence edges + domain aggregates

    [[nodiscard]] bool empty() const noexcept { return statements.empty(); }
    [[nodiscard]] size_t size() const noexcept { return statements.size(); }
};

} // namespace rdf
} // namespace slopgraph
