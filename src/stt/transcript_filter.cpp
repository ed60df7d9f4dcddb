#include "stt/transcript_filter.h"
#include "logger.h"
#include "utils.h"
#include <set>
#include <vector>

namespace samaira {
namespace stt {

namespace {

/// Lowercase, trailing punctuation removed
std::string word_key(const std::string& word) {
    std::string key = utils::normalize_copy(word);
    while (!key.empty() && (key.back() == '.' || key.back() == ',' ||
                            key.back() == '!' || key.back() == '?')) {
        key.pop_back();
    }
    return key;
}

bool is_bracketed(const std::string& t) {
    if (t.size() < 2) return false;
    return (t.front() == '[' && t.back() == ']') || (t.front() == '(' && t.back() == ')');
}

} // anonymous namespace

bool is_blank_transcript(const std::string& text, int64_t audio_ms) {
    if (utils::is_empty_or_whitespace(text)) return true;
    std::string t = utils::trim_copy(text);

    // Whisper annotates non-speech as [BLANK_AUDIO], (silence), [Music], ...
    if (is_bracketed(t)) return true;

    std::string lower = utils::normalize_copy(t);
    if (audio_ms < 1000 && (lower == "thank you." || lower == "thank you" || lower == "thanks.")) {
        return true;
    }
    return false;
}

std::string collapse_repeats(const std::string& text) {
    std::vector<std::string> words = utils::split_words(text);
    std::vector<std::string> kept;
    kept.reserve(words.size());

    size_t i = 0;
    while (i < words.size()) {
        std::string key = word_key(words[i]);
        size_t run_end = i + 1;
        while (run_end < words.size() && word_key(words[run_end]) == key) {
            run_end++;
        }

        size_t run = run_end - i;
        if (run > static_cast<size_t>(MAX_CONSECUTIVE_REPEATS)) {
            kept.push_back(words[i]);
        } else {
            kept.insert(kept.end(), words.begin() + i, words.begin() + run_end);
        }
        i = run_end;
    }
    return utils::join(kept);
}

std::string filter_transcript(const std::string& text, int64_t audio_ms) {
    if (is_blank_transcript(text, audio_ms)) {
        return "";
    }

    std::string cleaned = collapse_repeats(text);

    std::vector<std::string> words = utils::split_words(cleaned);
    if (words.size() >= MIN_WORDS_FOR_RATIO_CHECK) {
        std::set<std::string> distinct;
        for (const auto& w : words) {
            distinct.insert(word_key(w));
        }
        float ratio = static_cast<float>(distinct.size()) / static_cast<float>(words.size());
        if (ratio < MIN_DISTINCT_WORD_RATIO) {
            LOG_STT("Rejecting repetitive transcript (distinct ratio " + std::to_string(ratio) + ")");
            return "";
        }
    }

    return cleaned;
}

} // namespace stt
} // namespace samaira
