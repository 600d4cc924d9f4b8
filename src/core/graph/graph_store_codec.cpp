/**
 * @file graph_store_codec.cpp
 * @brief Statement key and value encoding
 */

#include "graph_store_codec.h"
#include "../rdf/namespaces.h"
#include <folly/dynamic.h>
#include <folly/json.h>

namespace slopgraph {
namespace graph {
namespace codec {

std::string encodeComponent(std::string_view value) {
    const auto length = static_cast<uint32_t>(value.size());
    std::string out;
    out.reserve(4 + value.size());
    out.push_back(static_cast<char>((length >> 24) & 0xFF));
    out.push_back(static_cast<char>((length >> 16) & 0xFF));
    out.push_back(static_cast<char>((length >> 8) & 0xFF));
    out.push_back(static_cast<char>(length & 0xFF));
    out.append(value);
    return out;
}

std::string encodeObject(const rdf::Term& term) {
    std::string out;
    out.push_back(static_cast<char>(term.kind));
    out += encodeComponent(term.value);
    out += encodeComponent(term.datatype);
    return out;
}

std::string spoKey(const rdf::Statement& statement) {
    return encodeComponent(statement.subject) +
           encodeComponent(statement.predicate) +
           encodeObject(statement.object);
}

std::string posKey(const rdf::Statement& statement) {
    return encodeComponent(statement.predicate) +
           encodeObject(statement.object) +
           encodeComponent(statement.subject);
}

std::string spoPrefix(const Iri& subject) {
    return encodeComponent(subject);
}

std::string spoPrefix(const Iri& subject, const Iri& predicate) {
    return encodeComponent(subject) + encodeComponent(predicate);
}

std::string posPrefix(const Iri& predicate, const rdf::Term& object) {
    return encodeComponent(predicate) + encodeObject(object);
}

// =============================================================================
// Values
// =============================================================================

std::string encodeStatement(const rdf::Statement& statement) {
    folly::dynamic obj = folly::dynamic::object
        ("s", statement.subject)
        ("p", statement.predicate)
        ("k", static_cast<int>(statement.object.kind))
        ("o", statement.object.value);

    if (statement.object.kind == rdf::TermKind::TYPED_LITERAL) {
        obj["dt"] = statement.object.datatype;
    }

    return folly::toJson(obj);
}

Result<rdf::Statement> decodeStatement(const std::string& data) {
    try {
        auto obj = folly::parseJson(data);
        rdf::Statement statement;

        statement.subject = obj["s"].asString();
        statement.predicate = obj["p"].asString();

        auto kind = obj["k"].asInt();
        if (kind < 0 || kind > static_cast<int64_t>(rdf::TermKind::TYPED_LITERAL)) {
            return Result<rdf::Statement>(ErrorCode::STORAGE_SERIALIZATION_ERROR,
                std::format("Unknown term kind {}", kind));
        }
        statement.object.kind = static_cast<rdf::TermKind>(kind);
        statement.object.value = obj["o"].asString();

        if (obj.find("dt") != obj.items().end()) {
            statement.object.datatype = obj["dt"].asString();
        }

        return Result<rdf::Statement>(std::move(statement));

    } catch (const std::exception& e) {
        return Result<rdf::Statement>(ErrorCode::STORAGE_SERIALIZATION_ERROR,
            std::format("Failed to decode statement: {}", e.what()));
    }
}

// =============================================================================
// Validation
// =============================================================================

bool isStorableIri(std::string_view iri) noexcept {
    if (iri.empty() || !rdf::isAbsoluteIri(iri)) {
        return false;
    }
    for (unsigned char c : iri) {
        if (c <= 0x20) return false;
        switch (c) {
            case '<': case '>': case '"': case '{': case '}':
            case '|': case '^': case '`': case '\\':
                return false;
            default:
                break;
        }
    }
    return true;
}

std::string validateStatement(const rdf::Statement& statement) {
    if (!isStorableIri(statement.subject)) {
        return std::format("invalid subject IRI '{}'", statement.subject);
    }
    if (!isStorableIri(statement.predicate)) {
        return std::format("invalid predicate IRI '{}'", statement.predicate);
    }
    if (statement.object.kind == rdf::TermKind::IRI && !isStorableIri(statement.object.value)) {
        return std::format("invalid object IRI '{}'", statement.object.value);
    }
    if (statement.object.kind == rdf::TermKind::TYPED_LITERAL &&
        !isStorableIri(statement.object.datatype)) {
        return std::format("invalid datatype IRI '{}'", statement.object.datatype);
    }
    return {};
}

} // namespace codec
} // namespace graph
} // namespace slopgraph
