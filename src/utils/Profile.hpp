#pragma once

#include <chrono>
#include <string>
#include <string_view>

// PAGENORM_PROFILING_LEVEL (CMake cache variable):
//   0 = off, the macros compile to nothing
//   1 = scope timers written to the profiling logger
//   2 = scope timers plus Tracy zones

#ifndef PAGENORM_PROFILING_LEVEL
#define PAGENORM_PROFILING_LEVEL 0
#endif

#if PAGENORM_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if PAGENORM_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if PAGENORM_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

// Logs the time spent in a scope ("[PROFILE] reflow took 42 us")
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << elapsed.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
#endif

} // namespace profiling

#if PAGENORM_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#elif PAGENORM_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer pagenorm_scope_timer_(__func__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer pagenorm_scope_timer_(nameExpr)

#else
#define PROFILE_SCOPE_FUNCTION()                                       \
    ZoneScoped;                                                        \
    ::profiling::detail::ScopeTimer pagenorm_scope_timer_(__func__)

// Stage names are runtime strings, so the Tracy zone takes a transient name
#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                              \
    ::profiling::detail::ScopeTimer pagenorm_scope_timer_(nameExpr);                                \
    ZoneTransientN(pagenorm_tracy_zone_, pagenorm_scope_timer_.name().c_str(), true)

#endif
