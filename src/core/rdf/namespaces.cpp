/**
 * @file namespaces.cpp
 * @brief Prefix table implementation
 */

#include "namespaces.h"
#include <algorithm>
#include <cctype>

namespace slopgraph {
namespace rdf {

namespace {

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// Conservative subset of the Turtle PN_LOCAL production
bool isSafeLocalName(std::string_view local) {
    if (local.empty()) {
        return true;
    }
    if (local.front() == '-' || local.front() == '.' || local.back() == '.') {
        return false;
    }
    for (size_t i = 0; i < local.size(); i++) {
        char c = local[i];
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            continue;
        }
        if (c == '%' && i + 2 < local.size() && isHex(local[i + 1]) && isHex(local[i + 2])) {
            i += 2;
            continue;
        }
        return false;
    }
    return true;
}

} // anonymous namespace

bool isAbsoluteIri(std::string_view term) noexcept {
    return term.find("://") != std::string_view::npos || term.starts_with("urn:");
}

const NamespaceTable& NamespaceTable::standard() {
    static const NamespaceTable table({
        {"slop", ns::SLOP},
        {"rdf", ns::RDF},
        {"rdfs", ns::RDFS},
        {"owl", ns::OWL},
        {"xsd", ns::XSD},
        {"foaf", ns::FOAF},
        {"dct", ns::DCT},
        {"cso", ns::CSO},
        {"msc", ns::MSC},
        {"schema", ns::SCHEMA},
    });
    return table;
}

void NamespaceTable::bind(const std::string& prefix, const std::string& uri) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
        [&prefix](const auto& entry) { return entry.first == prefix; });
    if (it != bindings_.end()) {
        it->second = uri;
    } else {
        bindings_.emplace_back(prefix, uri);
    }
}

std::optional<std::string> NamespaceTable::uriFor(std::string_view prefix) const {
    for (const auto& [name, uri] : bindings_) {
        if (name == prefix) {
            return uri;
        }
    }
    return std::nullopt;
}

Result<Iri> NamespaceTable::expand(std::string_view term) const {
    if (isAbsoluteIri(term)) {
        return Iri(term);
    }

    auto colon = term.find(':');
    if (colon == std::string_view::npos) {
        return Result<Iri>(ErrorCode::INVALID_ARGUMENT,
            std::format("Identifier '{}' is neither absolute nor prefixed", term));
    }

    auto prefix = term.substr(0, colon);
    auto uri = uriFor(prefix);
    if (!uri) {
        return Result<Iri>(ErrorCode::PREFIX_UNKNOWN,
            std::format("Unknown namespace prefix '{}' in '{}'", prefix, term));
    }

    return *uri + std::string(term.substr(colon + 1));
}

std::optional<std::string> NamespaceTable::compact(const Iri& iri) const {
    const std::pair<std::string, std::string>* best = nullptr;
    for (const auto& entry : bindings_) {
        if (iri.starts_with(entry.second) &&
            (!best || entry.second.size() > best->second.size())) {
            best = &entry;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    std::string_view local(iri);
    local.remove_prefix(best->second.size());
    if (!isSafeLocalName(local)) {
        return std::nullopt;
    }
    return best->first + ":" + std::string(local);
}

} // namespace rdf
} // namespace slopgraph
