#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Pipeline tracing switches. Stage logs go to the plog instance kLogInstance.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line preview: escapes line breaks and tabs, cuts at a UTF-8
    // character boundary after MaxPreview() bytes and appends the full size.
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "[PagePipeline] stage=<name> status=ok|error duration=<n>us"
    [[nodiscard]] static std::string StageLine(std::string_view stage, bool succeeded,
                                               std::chrono::microseconds duration);

private:
    static std::size_t utf8Boundary(std::string_view text, std::size_t limit) noexcept;
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
