#include "types.h"
#include <chrono>
#include <unordered_map>

namespace slopgraph {

// Document type conversion
DocumentType stringToDocumentType(const std::string& str) {
    static const std::unordered_map<std::string, DocumentType> map = {
        {"conversation", DocumentType::CONVERSATION},
        {"markdown", DocumentType::MARKDOWN},
        {"plain_text", DocumentType::PLAIN_TEXT},
        {"structured", DocumentType::STRUCTURED},
        {"random", DocumentType::RANDOM}
    };
    auto it = map.find(str);
    if (it == map.end()) {
        throw std::invalid_argument(std::format("Unknown document type: {}", str));
    }
    return it->second;
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                     return "SUCCESS";
        case ErrorCode::STORAGE_NOT_FOUND:           return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_WRITE_ERROR:         return "STORAGE_WRITE_ERROR";
        case ErrorCode::STORAGE_READ_ERROR:          return "STORAGE_READ_ERROR";
        case ErrorCode::STORAGE_SERIALIZATION_ERROR: return "STORAGE_SERIALIZATION_ERROR";
        case ErrorCode::STORE_LOCKED:                return "STORE_LOCKED";
        case ErrorCode::STORE_READ_ONLY:             return "STORE_READ_ONLY";
        case ErrorCode::STORE_NOT_OPEN:              return "STORE_NOT_OPEN";
        case ErrorCode::QUERY_INVALID_PARAMS:        return "QUERY_INVALID_PARAMS";
        case ErrorCode::QUERY_EXECUTION_ERROR:       return "QUERY_EXECUTION_ERROR";
        case ErrorCode::QUERY_TIMEOUT:               return "QUERY_TIMEOUT";
        case ErrorCode::ML_SERVICE_UNAVAILABLE:      return "ML_SERVICE_UNAVAILABLE";
        case ErrorCode::ML_SERVICE_ERROR:            return "ML_SERVICE_ERROR";
        case ErrorCode::CONFIG_NOT_FOUND:            return "CONFIG_NOT_FOUND";
        case ErrorCode::CONFIG_PARSE_ERROR:          return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE:        return "CONFIG_INVALID_VALUE";
        case ErrorCode::INVALID_ARGUMENT:            return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL_ERROR:              return "INTERNAL_ERROR";
        case ErrorCode::PREFIX_UNKNOWN:              return "PREFIX_UNKNOWN";
        default: return "UNKNOWN";
    }
}

Timestamp nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// UTF-8: continuation bytes are 10xxxxxx
size_t utf8Length(std::string_view text) noexcept {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string utf8Slice(std::string_view text, size_t start, size_t end) {
    if (end <= start) {
        return "";
    }

    size_t cp = 0;
    size_t byte_start = text.size();
    size_t byte_end = text.size();

    for (size_t i = 0; i < text.size(); i++) {
        auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80) continue;

        if (cp == start) byte_start = i;
        if (cp == end) {
            byte_end = i;
            break;
        }
        cp++;
    }

    if (byte_start >= byte_end) {
        return "";
    }
    return std::string(text.substr(byte_start, byte_end - byte_start));
}

std::string trim(std::string_view text) {
    const char* ws = " \t\r\n\f\v";
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = text.find_last_not_of(ws);
    return std::string(text.substr(first, last - first + 1));
}

} // namespace slopgraph
