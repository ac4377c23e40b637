#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace text_processing {

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                              // The actual result payload
    bool succeeded = true;                   // Whether the stage completed successfully
    std::optional<std::string> error;        // Error message if stage failed
    std::chrono::microseconds duration{0};   // How long the stage took to execute
    std::string stage_name;                  // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

// Outcome of one stage, without its payload
struct StageOutcome {
    std::string stage_name;
    bool succeeded = true;
    bool skipped = false;
    std::optional<std::string> error;
    std::chrono::microseconds duration{0};
};

// What happened while normalizing one page. Degradations stay visible here
// instead of failing the whole record.
struct NormalizationReport {
    std::vector<StageOutcome> stages;
    bool date_parsed = false;                 // published_date became a calendar date
    std::optional<std::string> script_converter;  // converter name, if one ran

    [[nodiscard]] bool allStagesSucceeded() const {
        for (const auto& stage : stages) {
            if (!stage.succeeded)
                return false;
        }
        return true;
    }
};

template<typename T>
StageOutcome outcomeOf(const StageResult<T>& stage) {
    return StageOutcome{ stage.stage_name, stage.succeeded, false, stage.error, stage.duration };
}

} // namespace text_processing
