#pragma once

#include "TextProcessingTypes.hpp"
#include "../record/PageRecord.hpp"

#include <memory>
#include <string>

namespace processing
{

class IScriptConverter;

// Turns one page's extraction JSON into a normalized NewspaperPage:
// parse -> date_normalizer -> reflow -> script_conversion.
// Reflow always runs on the extracted text; conversion comes after it.
class PagePipeline
{
public:
    // converter may be null (no conversion); it must outlive the pipeline
    explicit PagePipeline(const IScriptConverter* converter = nullptr);
    ~PagePipeline();

    PagePipeline(const PagePipeline&) = delete;
    PagePipeline& operator=(const PagePipeline&) = delete;

    // false only when the input cannot be parsed into a valid record
    bool process(const std::string& input, record::NewspaperPage& outPage, std::string& outError,
                 text_processing::NormalizationReport* outReport = nullptr);

    // Normalizes an already-validated page in place
    text_processing::NormalizationReport normalize(record::NewspaperPage& page) const;

    void setConverter(const IScriptConverter* converter);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
