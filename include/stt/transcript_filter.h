#pragma once

/**
 * @file transcript_filter.h
 * @brief Post-transcription cleanup: silence artifacts and repetition loops
 */

#include "core/types.h"
#include <string>

namespace samaira {
namespace stt {

/// Repeats of one word beyond this count are collapsed
constexpr int MAX_CONSECUTIVE_REPEATS = 3;

/// Distinct/total word ratio below which a long transcript is a hallucination
constexpr float MIN_DISTINCT_WORD_RATIO = 0.3f;

/// Word count from which the distinct-word ratio is checked
constexpr size_t MIN_WORDS_FOR_RATIO_CHECK = 10;

/**
 * @brief Check if transcript text is a known silence artifact
 * @param text Raw transcript text
 * @param audio_ms Duration of the transcribed audio
 * @return True for empty/whitespace, bracketed annotations such as
 *         [BLANK_AUDIO], (silence) or [Music], and a lone "Thank you."
 *         on sub-second audio
 */
bool is_blank_transcript(const std::string& text, int64_t audio_ms);

/**
 * @brief Collapse runs of the same word longer than MAX_CONSECUTIVE_REPEATS
 *
 * Comparison ignores case and trailing .,!? punctuation; the first
 * occurrence of a run is kept as written.
 */
std::string collapse_repeats(const std::string& text);

/**
 * @brief Full filter applied to every transcription result
 * @return Cleaned text, or empty if the transcript should be treated as blank
 */
std::string filter_transcript(const std::string& text, int64_t audio_ms);

} // namespace stt
} // namespace samaira
