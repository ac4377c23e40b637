#include "PagePipeline.hpp"
#include "DateNormalizer.hpp"
#include "Diagnostics.hpp"
#include "IScriptConverter.hpp"
#include "SentenceReflow.hpp"
#include "StageRunner.hpp"
#include "../record/RecordParser.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <sstream>
#include <plog/Log.h>

namespace processing
{

namespace
{

void logStageResult(const text_processing::StageResult<std::string>& stage, const std::string* input = nullptr)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << Diagnostics::StageLine(stage.stage_name, stage.succeeded, stage.duration);
    if (input)
        oss << " input=" << Diagnostics::Preview(*input);
    if (stage.succeeded)
    {
        oss << " output=" << Diagnostics::Preview(stage.result);
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        oss << " reason=" << (stage.error ? *stage.error : "unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

void logDateResult(const text_processing::StageResult<DateValue>& stage, const std::string& raw)
{
    if (!Diagnostics::IsVerbose() || !stage.succeeded)
        return;

    PLOG_INFO_(Diagnostics::kLogInstance) << Diagnostics::StageLine(stage.stage_name, true, stage.duration)
                                          << " input=" << Diagnostics::Preview(raw) << " parsed="
                                          << (isCalendarDate(stage.result) ? "yes" : "no")
                                          << " output=" << Diagnostics::Preview(toString(stage.result));
}

void logFallback(const char* stage, const char* kept)
{
    PLOG_WARNING_(Diagnostics::kLogInstance) << "[PagePipeline] stage=" << stage << " failed, keeping " << kept;
}

std::optional<std::string> convertOptional(const IScriptConverter& converter, const std::optional<std::string>& value)
{
    if (!value)
        return std::nullopt;
    return converter.convert(*value);
}

// Copy of the page with every free-text field converted
record::NewspaperPage convertPage(const IScriptConverter& converter, const record::NewspaperPage& page)
{
    record::NewspaperPage out = page;
    out.page_section_title = converter.convert(page.page_section_title);
    out.author = convertOptional(converter, page.author);
    out.photographer = convertOptional(converter, page.photographer);
    out.content = converter.convert(page.content);

    for (auto& table : out.tables)
    {
        table.csv_string = converter.convert(table.csv_string);
        table.caption = convertOptional(converter, table.caption);
    }

    for (auto& image : out.images)
    {
        image.description = converter.convert(image.description);
        image.caption = convertOptional(converter, image.caption);
    }

    return out;
}

} // anonymous namespace

struct PagePipeline::Impl
{
    explicit Impl(const IScriptConverter* c)
        : converter(c)
    {
    }

    record::RecordParser parser;
    const IScriptConverter* converter;
};

PagePipeline::PagePipeline(const IScriptConverter* converter)
    : impl_(std::make_unique<Impl>(converter))
{
}

PagePipeline::~PagePipeline() = default;

void PagePipeline::setConverter(const IScriptConverter* converter) { impl_->converter = converter; }

bool PagePipeline::process(const std::string& input, record::NewspaperPage& outPage, std::string& outError,
                           text_processing::NormalizationReport* outReport)
{
    PROFILE_SCOPE_CUSTOM("PagePipeline::process");

    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[PagePipeline] stage=input raw=" << Diagnostics::Preview(input);

    record::NewspaperPage page;
    if (!impl_->parser.parse(input, page, outError))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Extraction, "Extraction rejected", outError);
        return false;
    }

    auto report = normalize(page);
    outPage = std::move(page);
    if (outReport)
        *outReport = std::move(report);
    return true;
}

text_processing::NormalizationReport PagePipeline::normalize(record::NewspaperPage& page) const
{
    PROFILE_SCOPE_CUSTOM("PagePipeline::normalize");

    text_processing::NormalizationReport report;

    // Date: a value that stays a raw string is a degradation, not a failure
    const std::string raw_date = toString(page.published_date);
    auto date_stage = run_stage<DateValue>("date_normalizer",
                                           [&]()
                                           {
                                               return DateNormalizer::normalize(page.published_date);
                                           });
    logDateResult(date_stage, raw_date);
    report.stages.push_back(text_processing::outcomeOf(date_stage));
    if (date_stage.succeeded)
        page.published_date = date_stage.result;
    else
        logFallback("date_normalizer", "raw date");

    report.date_parsed = isCalendarDate(page.published_date);
    if (!report.date_parsed)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Normalization, "Published date left unparsed",
                                            raw_date);
    }

    auto reflow_stage = run_stage<std::string>("reflow",
                                               [&]()
                                               {
                                                   return SentenceReflow::reflow(page.content);
                                               });
    logStageResult(reflow_stage, &page.content);
    report.stages.push_back(text_processing::outcomeOf(reflow_stage));
    if (reflow_stage.succeeded)
        page.content = std::move(reflow_stage.result);
    else
        logFallback("reflow", "extracted content");

    if (!impl_->converter)
    {
        report.stages.push_back({ "script_conversion", true, true, std::nullopt, std::chrono::microseconds{ 0 } });
        return report;
    }

    const IScriptConverter& converter = *impl_->converter;
    auto conversion_stage = run_stage<record::NewspaperPage>("script_conversion",
                                                             [&]()
                                                             {
                                                                 return convertPage(converter, page);
                                                             });
    text_processing::StageOutcome conversion_outcome = text_processing::outcomeOf(conversion_stage);
    report.stages.push_back(conversion_outcome);
    if (conversion_stage.succeeded)
    {
        page = std::move(conversion_stage.result);
        report.script_converter = converter.name();
        if (Diagnostics::IsVerbose())
        {
            PLOG_INFO_(Diagnostics::kLogInstance)
                << Diagnostics::StageLine(conversion_outcome.stage_name, true, conversion_outcome.duration)
                << " converter=" << converter.name() << " output=" << Diagnostics::Preview(page.content);
        }
    }
    else
    {
        logFallback("script_conversion", "unconverted text");
    }

    return report;
}

} // namespace processing
