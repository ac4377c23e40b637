#include "SentenceReflow.hpp"
#include "TextUtils.hpp"

namespace processing
{

bool SentenceReflow::isEndingSymbol(char32_t cp) noexcept
{
    return kEndingSymbols.find(cp) != std::u32string_view::npos;
}

bool SentenceReflow::endsSentence(std::string_view sentence)
{
    auto last = lastCodepoint(sentence);
    return last && isEndingSymbol(*last);
}

bool SentenceReflow::isHeading(std::string_view line) noexcept
{
    return line.substr(0, kHeadingMarker.size()) == kHeadingMarker;
}

std::vector<std::string> SentenceReflow::sentences(std::string_view content)
{
    std::vector<std::string> out;
    std::string current;

    for (auto& line : splitLines(content))
    {
        if (isBlank(line))
        {
            if (!current.empty())
            {
                out.push_back(std::move(current));
                current.clear();
            }
            out.emplace_back();
            continue;
        }

        if (current.empty())
        {
            current = std::move(line);
        }
        else if (endsSentence(current) || isHeading(line))
        {
            out.push_back(std::move(current));
            current = std::move(line);
        }
        else
        {
            current += line;
        }
    }

    if (!current.empty())
        out.push_back(std::move(current));

    return out;
}

std::string SentenceReflow::reflow(std::string_view content)
{
    auto parts = sentences(content);

    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            result += '\n';
        result += parts[i];
    }
    return result;
}

} // namespace processing
