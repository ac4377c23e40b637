#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Reassembles sentences that OCR split over several lines.
//
// A line is appended to the pending sentence unless the sentence already ends
// in terminal punctuation or the line opens with a "**" heading marker.
// Blank lines flush the pending sentence and are kept as paragraph breaks.
class SentenceReflow
{
public:
    // Western and East Asian terminal punctuation, plus closing quotes/brackets and '*'
    static constexpr std::u32string_view kEndingSymbols = U".。!?:;」』）)》\"'*";
    static constexpr std::string_view kHeadingMarker = "**";

    // Emitted sentences in order; "" entries mark paragraph breaks
    [[nodiscard]] static std::vector<std::string> sentences(std::string_view content);

    // sentences() joined with '\n'
    [[nodiscard]] static std::string reflow(std::string_view content);

    [[nodiscard]] static bool isEndingSymbol(char32_t cp) noexcept;
    [[nodiscard]] static bool endsSentence(std::string_view sentence);
    [[nodiscard]] static bool isHeading(std::string_view line) noexcept;
};

} // namespace processing
