#pragma once

#include <chrono>
#include <string_view>

// PIIGUARD_PROFILING_LEVEL comes from CMake:
//   0 = macros compile to nothing
//   1 = elapsed time written to the profiling logger
//   2 = level 1 plus Tracy zones

#ifndef PIIGUARD_PROFILING_LEVEL
#define PIIGUARD_PROFILING_LEVEL 0
#endif

#if PIIGUARD_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if PIIGUARD_PROFILING_LEVEL >= 1
#include <plog/Log.h>

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

/// Logs the lifetime of a scope in microseconds. The name must outlive the timer.
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        PLOG_DEBUG_(kProfilingLogInstance) << "[Profile] " << name_ << ": "
                                           << std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()
                                           << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace profiling
#endif

#if PIIGUARD_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(name) ((void)sizeof(name))

#elif PIIGUARD_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() const ::profiling::ScopeTimer piiguard_scope_timer_(__func__)
#define PROFILE_SCOPE_CUSTOM(name) const ::profiling::ScopeTimer piiguard_scope_timer_(name)

#else
#define PROFILE_SCOPE_FUNCTION()   \
    ZoneScopedN(__func__);         \
    const ::profiling::ScopeTimer piiguard_scope_timer_(__func__)

#define PROFILE_SCOPE_CUSTOM(name)                                             \
    ZoneScoped;                                                                \
    const ::profiling::ScopeTimer piiguard_scope_timer_(name);                 \
    ZoneName(std::string_view(name).data(), std::string_view(name).size())

#endif
