/**
 * Reply text handling: speech preparation and span segmentation.
 * Run from build dir: ./test_text
 */

#include "text/span_segmenter.h"
#include "text/speech_text.h"
#include <iostream>
#include <string>
#include <vector>

using namespace samaira;
using namespace samaira::text;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- prepare_text_for_speech ---
    ASSERT(prepare_text_for_speech("**SIP** returns 12% p.a. on \xE2\x82\xB9" "5000") ==
           "SIP returns 12% per annum on rupees 5000");
    ASSERT(prepare_text_for_speech("Rs.500 only") == "rupees 500 only");
    ASSERT(prepare_text_for_speech("Mrs. Sharma") == "Mrs. Sharma");  // not a currency
    ASSERT(prepare_text_for_speech("5 lakhs and 2 crores") == "5 lakh and 2 crore");
    ASSERT(prepare_text_for_speech("Debt funds, i.e. safer, e.g. liquid funds etc.") ==
           "Debt funds, that is safer, for example liquid funds et cetera");
    ASSERT(prepare_text_for_speech("# Heading with `code`") == "Heading with code");
    ASSERT(prepare_text_for_speech("  lots   of \n space ") == "lots of space");
    ASSERT(prepare_text_for_speech("**").empty());
    ASSERT(prepare_text_for_speech("   ").empty());

    // --- Sentence boundaries need trailing whitespace ---
    {
        SpanSegmenter seg;
        ASSERT(seg.push("Namaste").empty());
        ASSERT(seg.push(".").empty());
        auto spans = seg.push(" Aap");
        ASSERT(spans.size() == 1 && spans[0] == "Namaste.");
        ASSERT(seg.pending() == " Aap");
    }

    // --- Question, exclamation and danda ---
    {
        SpanSegmenter seg;
        auto spans = seg.push("Kya? Haan! Theek hai\xE0\xA5\xA4 Aur");
        ASSERT(spans.size() == 3);
        ASSERT(spans[0] == "Kya?");
        ASSERT(spans[1] == "Haan!");
        ASSERT(spans[2] == "Theek hai\xE0\xA5\xA4");
        auto rest = seg.flush();
        ASSERT(rest.size() == 1 && rest[0] == "Aur");
    }

    // --- Abbreviations do not split ---
    {
        SpanSegmenter seg;
        auto spans = seg.push("SIP 12% p.a. deta hai, e.g. index funds. Next");
        ASSERT(spans.size() == 1);
        ASSERT(spans[0] == "SIP 12% p.a. deta hai, e.g. index funds.");
    }

    // --- Over-long text is cut at whitespace ---
    {
        SpanSegmenter seg(20);
        auto spans = seg.push("ek do teen char paanch chhe saat");
        ASSERT(spans.size() == 1);
        ASSERT(spans[0] == "ek do teen char");
        for (const auto& s : spans) ASSERT(s.size() <= 20);
        auto rest = seg.flush();
        ASSERT(rest.size() == 1 && rest[0] == "paanch chhe saat");
    }

    // --- One unbroken word longer than the limit ---
    {
        SpanSegmenter seg(8);
        auto spans = seg.push("abcdefghijkl");
        ASSERT(spans.size() == 1 && spans[0] == "abcdefgh");
        ASSERT(seg.flush()[0] == "ijkl");
    }

    // --- Token stream without a terminator flushes once ---
    {
        SpanSegmenter seg;
        std::vector<std::string> tokens = {"SIP ", "ek ", "accha ", "option ", "hai"};
        for (const auto& t : tokens) ASSERT(seg.push(t).empty());
        auto spans = seg.flush();
        ASSERT(spans.size() == 1 && spans[0] == "SIP ek accha option hai");
        ASSERT(seg.flush().empty());
    }

    // --- Whitespace-only tail, reset ---
    {
        SpanSegmenter seg;
        seg.push("Done. ");
        ASSERT(seg.flush().empty());
        seg.push("leftover");
        seg.reset();
        ASSERT(seg.pending().empty());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All text tests passed.\n";
    return 0;
}
