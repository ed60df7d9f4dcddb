#pragma once

/**
 * @file span_segmenter.h
 * @brief Incremental split of a token stream into synthesis spans
 *
 * A span ends at `.`, `?`, `!` or the danda when followed by whitespace.
 * Known abbreviations (p.a., i.e., e.g., Rs.) do not end a span. Text that
 * grows past the limit without a terminator is cut at the last whitespace.
 */

#include "core/constants.h"
#include <string>
#include <vector>

namespace samaira {
namespace text {

class SpanSegmenter {
public:
    explicit SpanSegmenter(size_t max_span_chars = constants::bridge::MAX_SPAN_CHARS);

    /**
     * @brief Append one token
     * @return Spans completed by this token, in order (trimmed, never empty)
     */
    std::vector<std::string> push(const std::string& token);

    /**
     * @brief End of stream: return the trailing text as a final span
     * @return Empty vector if nothing but whitespace remains
     */
    std::vector<std::string> flush();

    void reset();

    /// Text received but not yet emitted as a span
    const std::string& pending() const { return buffer_; }

private:
    /// Byte offset just past the first span boundary, or npos
    size_t find_boundary() const;

    /// Cut point for an over-long buffer (at most max_span_chars_)
    size_t find_forced_cut() const;

    void emit(size_t cut, std::vector<std::string>& out);

    size_t max_span_chars_;
    std::string buffer_;
};

} // namespace text
} // namespace samaira
