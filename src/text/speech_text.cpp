#include "text/speech_text.h"
#include "utils.h"
#include <cctype>
#include <utility>
#include <vector>

namespace samaira {
namespace text {

namespace {

/// Replace `from` only where it is not glued to a preceding letter
std::string replace_word_start(const std::string& str, const std::string& from, const std::string& to) {
    std::string out;
    out.reserve(str.size());
    size_t pos = 0;
    while (true) {
        size_t hit = str.find(from, pos);
        if (hit == std::string::npos) {
            out.append(str, pos, std::string::npos);
            break;
        }
        bool glued = hit > 0 && std::isalpha(static_cast<unsigned char>(str[hit - 1]));
        out.append(str, pos, hit - pos);
        out += glued ? from : to;
        pos = hit + from.size();
    }
    return out;
}

} // anonymous namespace

std::string prepare_text_for_speech(const std::string& span) {
    std::string text = span;

    // Markdown
    for (const char* marker : {"**", "*", "#", "`"}) {
        text = utils::replace_all(text, marker, "");
    }
    text = utils::replace_all(text, "\xE2\x80\xA2 ", "");  // bullet

    // Currency
    text = utils::replace_all(text, "\xE2\x82\xB9", "rupees ");  // rupee sign
    text = replace_word_start(text, "Rs.", "rupees ");

    // Abbreviations
    static const std::vector<std::pair<std::string, std::string>> abbreviations = {
        {"p.a.", "per annum"},
        {"i.e.", "that is"},
        {"e.g.", "for example"},
        {"etc.", "et cetera"},
    };
    for (const auto& abbr : abbreviations) {
        text = replace_word_start(text, abbr.first, abbr.second);
    }

    // Indian number words read better singular
    text = utils::replace_all(text, " lakhs", " lakh");
    text = utils::replace_all(text, " crores", " crore");

    return utils::collapse_whitespace(text);
}

} // namespace text
} // namespace samaira
