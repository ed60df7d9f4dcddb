#include "text/span_segmenter.h"
#include "utils.h"
#include <algorithm>
#include <cctype>

namespace samaira {
namespace text {

namespace {

const std::string DANDA = "\xE0\xA5\xA4";  // U+0964

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// True if the word ending at `dot` (inclusive) is an abbreviation, not a sentence end
bool ends_with_abbreviation(const std::string& buf, size_t dot) {
    static const char* abbreviations[] = {"p.a.", "i.e.", "e.g.", "Rs.", "rs.", "Mr.", "Mrs.", "Dr."};
    for (const char* abbr : abbreviations) {
        std::string a(abbr);
        if (dot + 1 < a.size()) continue;
        size_t start = dot + 1 - a.size();
        if (buf.compare(start, a.size(), a) != 0) continue;
        if (start == 0 || is_space(buf[start - 1])) return true;
    }
    return false;
}

} // anonymous namespace

SpanSegmenter::SpanSegmenter(size_t max_span_chars)
    : max_span_chars_(max_span_chars == 0 ? constants::bridge::MAX_SPAN_CHARS : max_span_chars) {}

std::vector<std::string> SpanSegmenter::push(const std::string& token) {
    std::vector<std::string> spans;
    buffer_ += token;

    while (true) {
        size_t cut = find_boundary();
        if (cut == std::string::npos) {
            break;
        }
        emit(cut, spans);
    }

    while (utils::trim_copy(buffer_).size() > max_span_chars_) {
        emit(find_forced_cut(), spans);
    }
    return spans;
}

std::vector<std::string> SpanSegmenter::flush() {
    std::vector<std::string> spans;
    while (utils::trim_copy(buffer_).size() > max_span_chars_) {
        emit(find_forced_cut(), spans);
    }
    emit(buffer_.size(), spans);
    return spans;
}

void SpanSegmenter::reset() {
    buffer_.clear();
}

size_t SpanSegmenter::find_boundary() const {
    for (size_t i = 0; i < buffer_.size(); ++i) {
        char c = buffer_[i];
        size_t end = std::string::npos;

        if (c == '?' || c == '!') {
            end = i + 1;
        } else if (c == '.') {
            if (!ends_with_abbreviation(buffer_, i)) {
                end = i + 1;
            }
        } else if (buffer_.compare(i, DANDA.size(), DANDA) == 0) {
            end = i + DANDA.size();
        }

        // Terminator must be followed by whitespace we have already received
        if (end != std::string::npos && end < buffer_.size() && is_space(buffer_[end])) {
            return end;
        }
    }
    return std::string::npos;
}

size_t SpanSegmenter::find_forced_cut() const {
    size_t lead = 0;
    while (lead < buffer_.size() && is_space(buffer_[lead])) {
        lead++;
    }
    size_t limit = std::min(buffer_.size(), lead + max_span_chars_);

    for (size_t i = limit; i > lead; --i) {
        if (is_space(buffer_[i - 1])) {
            return i - 1;
        }
    }

    // One unbroken word: hard cut, backing off to a UTF-8 character boundary
    size_t cut = limit;
    while (cut > lead + 1 && cut < buffer_.size() && is_utf8_continuation(buffer_[cut])) {
        cut--;
    }
    return cut;
}

void SpanSegmenter::emit(size_t cut, std::vector<std::string>& out) {
    std::string span = utils::trim_copy(buffer_.substr(0, cut));
    buffer_.erase(0, cut);
    if (!span.empty()) {
        out.push_back(std::move(span));
    }
}

} // namespace text
} // namespace samaira
