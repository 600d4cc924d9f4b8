/**
 * @file span_extractor.h
 * @brief Interface to the span extraction model
 */

#pragma once

#include "span.h"
#include <algorithm>
#include <string>
#include <vector>

namespace slopgraph {
namespace extraction {

/**
 * @brief Source of labeled span candidates
 *
 * Implementations return offsets into the text they were given and fill in
 * Span::context. Offsets are not trusted downstream.
 */
class SpanExtractor {
public:
    virtual ~SpanExtractor() = default;

    /**
     * @brief Extract span candidates from preprocessed text
     * @return spans, or ML_SERVICE_UNAVAILABLE / ML_SERVICE_ERROR
     */
    virtual Result<std::vector<Span>> extract(const std::string& text) const = 0;
};

/**
 * @brief Up to `window` code points either side of [start, end), trimmed
 */
[[nodiscard]] inline std::string contextAround(std::string_view text, int64_t start, int64_t end,
                                               int64_t window) {
    // Offsets and window are clamped to the text before any arithmetic
    const auto length = static_cast<int64_t>(utf8Length(text));
    window = std::clamp<int64_t>(window, 0, length);
    const int64_t from = std::clamp<int64_t>(start, 0, length) - window;
    const int64_t to = std::clamp<int64_t>(end, 0, length) + window;
    const int64_t first = std::max<int64_t>(from, 0);
    const int64_t last = std::min(to, length);
    if (last <= first) {
        return "";
    }
    return trim(utf8Slice(text, static_cast<size_t>(first), static_cast<size_t>(last)));
}

} // namespace extraction
} // namespace slopgraph
