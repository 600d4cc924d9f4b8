/**
 * @file text_classifier.h
 * @brief Line-pattern document classification and text preprocessing
 */

#pragma once

#include "../common/types.h"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace slopgraph {
namespace document {

/**
 * @brief Classifies documents by the share of lines matching each pattern family
 *
 * Scores are (matching lines / total lines) per family; the best family wins
 * with its score as confidence, ties going to conversation, then markdown.
 * A best score under kMinimumScore falls back to plain text at 0.5.
 * Whitespace-only input is RANDOM with confidence 0 and no features.
 */
class TextClassifier {
public:
    static constexpr double kMinimumScore = 0.1;
    static constexpr double kFallbackConfidence = 0.5;

    TextClassifier();

    [[nodiscard]] DocumentMetadata classify(std::string_view content) const;

    /**
     * @brief Text handed to the extraction service
     *
     * Drops fenced code blocks, collapses whitespace runs to single spaces
     * and strips bold/italic/inline-code markers. Linear in the input size.
     */
    [[nodiscard]] static std::string preprocess(std::string_view content);

    /**
     * @brief Suggested title for a classified document, if any line qualifies
     */
    [[nodiscard]] static std::optional<std::string> suggestTitle(
        const std::vector<std::string>& lines, DocumentType type);

private:
    // Lines matching any pattern (within a bounded prefix) or also_matches
    [[nodiscard]] static int64_t countMatching(const std::vector<std::string>& lines,
                                               const std::vector<std::regex>& patterns,
                                               bool (*also_matches)(std::string_view) = nullptr);

    std::vector<std::regex> conversation_patterns_;
    std::vector<std::regex> markdown_patterns_;
    std::vector<std::regex> structured_patterns_;
};

} // namespace document
} // namespace slopgraph
