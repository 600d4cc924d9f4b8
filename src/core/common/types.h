/**
 * @file types.h
 * @brief slopgraph core type definitions
 *
 * Basic aliases, the document classification enum, the error code
 * table and the Result type shared by every module.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <stdexcept>
#include <format>

namespace slopgraph {

// =============================================================================
// Basic types
// =============================================================================

/** Full or prefixed IRI of a graph node */
using Iri = std::string;

/** Timestamp (Unix epoch, millisecond precision) */
using Timestamp = int64_t;

/** Confidence score (0.0 - 1.0) */
using Confidence = double;

/** Feature value: only numeric and boolean values become statements */
using PropertyValue = std::variant<
    std::monostate,           // empty
    bool,                     // boolean
    int64_t,                  // integer
    double,                   // float
    std::string,              // string
    std::vector<std::string>  // string list
>;

/** Feature table, ordered so that emitted statements are deterministic */
using Properties = std::map<std::string, PropertyValue>;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Coarse document classification
 */
enum class DocumentType : uint8_t {
    CONVERSATION,  // speaker-prefixed lines
    MARKDOWN,      // headers, lists, code
    PLAIN_TEXT,    // fallback
    STRUCTURED,    // numbered sections, tables, rules
    RANDOM         // empty or unclassifiable input
};

[[nodiscard]] inline std::string documentTypeToString(DocumentType type) {
    switch (type) {
        case DocumentType::CONVERSATION: return "conversation";
        case DocumentType::MARKDOWN:     return "markdown";
        case DocumentType::PLAIN_TEXT:   return "plain_text";
        case DocumentType::STRUCTURED:   return "structured";
        case DocumentType::RANDOM:       return "random";
        default: return "unknown";
    }
}

/**
 * @brief Ontology class local name for a document type (e.g. "PlainTextDocument")
 */
[[nodiscard]] inline std::string documentTypeClassName(DocumentType type) {
    switch (type) {
        case DocumentType::CONVERSATION: return "ConversationDocument";
        case DocumentType::MARKDOWN:     return "MarkdownDocument";
        case DocumentType::PLAIN_TEXT:   return "PlainTextDocument";
        case DocumentType::STRUCTURED:   return "StructuredDocument";
        case DocumentType::RANDOM:       return "RandomDocument";
        default: return "Document";
    }
}

/**
 * @brief Parse a DocumentType from its string form
 * @throws std::invalid_argument on unknown names
 */
[[nodiscard]] DocumentType stringToDocumentType(const std::string& str);

/**
 * @brief Classifier output consumed by the ontology mapper
 */
struct DocumentMetadata {
    DocumentType doc_type = DocumentType::PLAIN_TEXT;
    Confidence confidence = 0.0;
    Properties features;                       // numeric/boolean features become statements
    std::optional<std::string> suggested_title;
};

// =============================================================================
// Error handling
// =============================================================================

/**
 * @brief System error codes
 */
enum class ErrorCode : uint16_t {
    SUCCESS = 0,

    // Storage
    STORAGE_NOT_FOUND = 1001,
    STORAGE_WRITE_ERROR = 1003,
    STORAGE_READ_ERROR = 1004,
    STORAGE_SERIALIZATION_ERROR = 1005,
    STORE_LOCKED = 1006,
    STORE_READ_ONLY = 1007,
    STORE_NOT_OPEN = 1008,

    // Query
    QUERY_INVALID_PARAMS = 2001,
    QUERY_EXECUTION_ERROR = 2002,
    QUERY_TIMEOUT = 2003,

    // Extraction service
    ML_SERVICE_UNAVAILABLE = 3001,
    ML_SERVICE_ERROR = 3003,

    // Configuration
    CONFIG_NOT_FOUND = 4001,
    CONFIG_PARSE_ERROR = 4002,
    CONFIG_INVALID_VALUE = 4003,

    // Runtime
    INVALID_ARGUMENT = 5001,
    INTERNAL_ERROR = 5003,
    PREFIX_UNKNOWN = 5004
};

[[nodiscard]] std::string errorCodeToString(ErrorCode code);

/**
 * @brief Result type (similar to Rust's Result)
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), is_ok_(true) {}
    Result(ErrorCode code, std::string message)
        : error_code_(code), error_message_(std::move(message)), is_ok_(false) {}

    [[nodiscard]] bool isOk() const noexcept { return is_ok_; }
    [[nodiscard]] bool isError() const noexcept { return !is_ok_; }

    [[nodiscard]] T& value() & {
        if (!is_ok_) throw std::runtime_error("Result contains error: " + error_message_);
        return value_;
    }
    [[nodiscard]] const T& value() const& {
        if (!is_ok_) throw std::runtime_error("Result contains error: " + error_message_);
        return value_;
    }
    [[nodiscard]] T&& value() && {
        if (!is_ok_) throw std::runtime_error("Result contains error: " + error_message_);
        return std::move(value_);
    }

    [[nodiscard]] ErrorCode errorCode() const { return error_code_; }
    [[nodiscard]] const std::string& errorMessage() const { return error_message_; }

private:
    T value_{};
    ErrorCode error_code_ = ErrorCode::SUCCESS;
    std::string error_message_;
    bool is_ok_;
};

// =============================================================================
// Utility functions
// =============================================================================

/**
 * @brief Current wall-clock time in milliseconds
 */
[[nodiscard]] Timestamp nowMillis();

/**
 * @brief Number of Unicode code points in a UTF-8 string
 *
 * Span offsets are expressed in code points, not bytes.
 */
[[nodiscard]] size_t utf8Length(std::string_view text) noexcept;

/**
 * @brief Substring by code point range [start, end), clamped to the text
 */
[[nodiscard]] std::string utf8Slice(std::string_view text, size_t start, size_t end);

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
[[nodiscard]] std::string trim(std::string_view text);

} // namespace slopgraph
