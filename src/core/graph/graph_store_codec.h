/**
 * @file graph_store_codec.h
 * @brief Key layout and value encoding for the statement column families
 *
 * Keys are concatenations of length-prefixed components (4-byte big-endian
 * length, then bytes), so a prefix built from whole components matches
 * exactly that component sequence and nothing longer.
 */

#pragma once

#include "../common/types.h"
#include "../rdf/statement.h"
#include <stdexcept>
#include <string>
#include <string_view>

namespace slopgraph {
namespace graph {
namespace codec {

/**
 * @brief Raised inside scans when the caller's deadline has passed
 */
struct QueryTimeoutError : std::runtime_error {
    QueryTimeoutError() : std::runtime_error("query deadline exceeded") {}
};

/**
 * @brief Raised inside scans on iterator or decoding failures
 */
struct StorageScanError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string encodeComponent(std::string_view value);

/** Term kind byte followed by value and datatype components */
[[nodiscard]] std::string encodeObject(const rdf::Term& term);

[[nodiscard]] std::string spoKey(const rdf::Statement& statement);
[[nodiscard]] std::string posKey(const rdf::Statement& statement);

[[nodiscard]] std::string spoPrefix(const Iri& subject);
[[nodiscard]] std::string spoPrefix(const Iri& subject, const Iri& predicate);
[[nodiscard]] std::string posPrefix(const Iri& predicate, const rdf::Term& object);

/**
 * @brief Statement as a folly JSON document
 */
[[nodiscard]] std::string encodeStatement(const rdf::Statement& statement);

/**
 * @brief Inverse of encodeStatement
 * @return statement, or STORAGE_SERIALIZATION_ERROR
 */
[[nodiscard]] Result<rdf::Statement> decodeStatement(const std::string& data);

/**
 * @brief Absolute IRI without whitespace or characters Turtle cannot carry in <...>
 */
[[nodiscard]] bool isStorableIri(std::string_view iri) noexcept;

/**
 * @brief Validate every IRI position of a statement
 * @return empty string when valid, otherwise the reason
 */
[[nodiscard]] std::string validateStatement(const rdf::Statement& statement);

} // namespace codec
} // namespace graph
} // namespace slopgraph
