/**
 * @file text_classifier.cpp
 * @brief Document classification and preprocessing
 */

#include "text_classifier.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace slopgraph {
namespace document {

namespace {

std::vector<std::regex> compile(std::initializer_list<const char*> patterns) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const char* pattern : patterns) {
        compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
    }
    return compiled;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    while (true) {
        size_t newline = text.find('\n', begin);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(begin));
            break;
        }
        lines.emplace_back(text.substr(begin, newline - begin));
        begin = newline + 1;
    }
    return lines;
}

// First six words of a line, "..." appended when the line had at least six
std::string leadingWords(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (words.size() < 6 && stream >> word) {
        words.push_back(word);
    }

    std::string title;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) title += ' ';
        title += words[i];
    }
    if (words.size() == 6) {
        title += "...";
    }
    return title;
}

bool colonInPrefix(const std::string& line, size_t code_points) {
    return utf8Slice(line, 0, code_points).find(':') != std::string::npos;
}

// std::regex recurses per matched character, so patterns only ever see this
// many leading bytes of a line
constexpr size_t kPatternPrefixBytes = 256;

bool matchesPrefix(const std::string& line, const std::regex& pattern) {
    const auto end = line.begin() + static_cast<std::ptrdiff_t>(std::min(line.size(), kPatternPrefixBytes));
    return std::regex_search(line.begin(), end, pattern);
}

// "[text](target)" at the start of a line
bool isLinkLine(std::string_view line) {
    if (line.empty() || line.front() != '[') return false;
    size_t close = line.find("](", 1);
    return close != std::string_view::npos && line.find(')', close + 2) != std::string_view::npos;
}

// A backtick pair with at least one character between
bool hasInlineCode(std::string_view line) {
    size_t open = line.find('`');
    while (open != std::string_view::npos) {
        size_t close = line.find('`', open + 1);
        if (close == std::string_view::npos) return false;
        if (close > open + 1) return true;
        open = close;
    }
    return false;
}

// Removes every "```...```" block; an unclosed fence is left as is
std::string removeFences(std::string_view text) {
    static constexpr std::string_view fence = "```";
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(fence, pos);
        if (open == std::string_view::npos) break;
        size_t close = text.find(fence, open + fence.size());
        if (close == std::string_view::npos) break;
        out.append(text.substr(pos, open - pos));
        pos = close + fence.size();
    }
    if (pos < text.size()) out.append(text.substr(pos));
    return out;
}

std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) out += ' ';
            in_space = true;
        } else {
            out += c;
            in_space = false;
        }
    }
    return out;
}

// Replaces each "<marker>inner<marker>" with inner, leftmost pairs first
std::string unwrapMarker(std::string_view text, std::string_view marker) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(marker, pos);
        if (open == std::string_view::npos) break;
        size_t close = text.find(marker, open + marker.size());
        if (close == std::string_view::npos) break;
        out.append(text.substr(pos, open - pos));
        out.append(text.substr(open + marker.size(), close - open - marker.size()));
        pos = close + marker.size();
    }
    if (pos < text.size()) out.append(text.substr(pos));
    return out;
}

} // anonymous namespace

TextClassifier::TextClassifier()
    : conversation_patterns_(compile({
          R"(^[A-Z][a-z]+:)",          // "Alice:"
          R"(^[a-zA-Z0-9_-]+:)",       // "user123:"
          R"(^\*\*[^*]+\*\*:)",        // "**Assistant**:"
          R"(^>\s)",                   // quoted reply
      }))
    , markdown_patterns_(compile({
          R"(^#{1,6}\s)",              // headers
          R"(^\*\s)",                  // bullet lists
          R"(^\d+\.\s)",               // numbered lists
          R"(^```)",                   // fences
      }))
    , structured_patterns_(compile({
          R"(^\d+\.)",                 // numbered items
          R"(^[A-Z][A-Z\s]+:)",        // "SECTION HEADER:"
          R"(^-{3,})",                 // rules
          R"(^\|)",                    // tables
      })) {
}

int64_t TextClassifier::countMatching(const std::vector<std::string>& lines,
                                      const std::vector<std::regex>& patterns,
                                      bool (*also_matches)(std::string_view)) {
    int64_t count = 0;
    for (const auto& line : lines) {
        bool matched = std::any_of(patterns.begin(), patterns.end(),
            [&](const std::regex& pattern) { return matchesPrefix(line, pattern); });
        if (!matched && also_matches != nullptr) {
            matched = also_matches(line);
        }
        if (matched) count++;
    }
    return count;
}

DocumentMetadata TextClassifier::classify(std::string_view content) const {
    DocumentMetadata metadata;

    auto body = trim(content);
    if (body.empty()) {
        metadata.doc_type = DocumentType::RANDOM;
        metadata.confidence = 0.0;
        return metadata;
    }

    auto lines = splitLines(body);
    const auto total = static_cast<int64_t>(lines.size());

    const int64_t conversation = countMatching(lines, conversation_patterns_);
    const int64_t markdown = countMatching(lines, markdown_patterns_, [](std::string_view line) {
        return isLinkLine(line) || hasInlineCode(line);
    });
    const int64_t structured = countMatching(lines, structured_patterns_);

    const std::pair<DocumentType, double> scores[] = {
        {DocumentType::CONVERSATION, static_cast<double>(conversation) / total},
        {DocumentType::MARKDOWN, static_cast<double>(markdown) / total},
        {DocumentType::STRUCTURED, static_cast<double>(structured) / total},
    };

    // First maximum wins
    auto best = scores[0];
    for (const auto& score : scores) {
        if (score.second > best.second) best = score;
    }

    metadata.doc_type = best.first;
    metadata.confidence = best.second;
    if (best.second < kMinimumScore) {
        metadata.doc_type = DocumentType::PLAIN_TEXT;
        metadata.confidence = kFallbackConfidence;
    }

    size_t total_length = 0;
    bool has_headers = false;
    bool has_speakers = false;
    for (size_t i = 0; i < lines.size(); i++) {
        total_length += utf8Length(lines[i]);
        has_headers = has_headers || (!lines[i].empty() && lines[i].front() == '#');
        if (i < 10) {
            has_speakers = has_speakers || colonInPrefix(lines[i], 50);
        }
    }

    metadata.features["line_count"] = total;
    metadata.features["avg_line_length"] = static_cast<double>(total_length) / total;
    metadata.features["conversation_markers"] = conversation;
    metadata.features["markdown_markers"] = markdown;
    metadata.features["structured_markers"] = structured;
    metadata.features["has_headers"] = has_headers;
    metadata.features["has_speakers"] = has_speakers;

    metadata.suggested_title = suggestTitle(lines, metadata.doc_type);
    return metadata;
}

std::optional<std::string> TextClassifier::suggestTitle(const std::vector<std::string>& lines,
                                                        DocumentType type) {
    if (type == DocumentType::MARKDOWN) {
        for (size_t i = 0; i < lines.size() && i < 5; i++) {
            const auto& line = lines[i];
            if (line.empty() || line.front() != '#') continue;

            size_t text_start = line.find_first_not_of('#');
            if (text_start == std::string::npos) continue;

            auto title = trim(std::string_view(line).substr(text_start));
            if (!title.empty()) return title;
        }
    }

    // Conversations skip speaker lines
    if (type == DocumentType::CONVERSATION) {
        for (size_t i = 0; i < lines.size() && i < 5; i++) {
            if (utf8Length(trim(lines[i])) > 10 && !colonInPrefix(lines[i], 50)) {
                return leadingWords(lines[i]);
            }
        }
    }

    for (size_t i = 0; i < lines.size() && i < 3; i++) {
        if (utf8Length(trim(lines[i])) > 10) {
            return leadingWords(lines[i]);
        }
    }

    return std::nullopt;
}

std::string TextClassifier::preprocess(std::string_view content) {
    // Fences go first so their backticks are not read as inline code
    std::string text = removeFences(content);
    text = collapseWhitespace(text);
    text = unwrapMarker(text, "**");
    text = unwrapMarker(text, "*");
    text = unwrapMarker(text, "`");
    return trim(text);
}

} // namespace document
} // namespace slopgraph
