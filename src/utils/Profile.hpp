#pragma once

// GLYPHSCRUB_PROFILING_LEVEL is set via CMake:
//   0 = Disabled
//   1 = Scope timers logged to the profiling plog instance
//   2 = Tracy zones as well

#ifndef GLYPHSCRUB_PROFILING_LEVEL
#define GLYPHSCRUB_PROFILING_LEVEL 0
#endif

#if GLYPHSCRUB_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#include <cstdint>
#endif

#if GLYPHSCRUB_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#include <chrono>
#include <cstddef>
#include <string_view>
#endif

namespace profiling
{

// Written to profiling.log beside the main log
constexpr int kProfilingLogInstance = 2;

#if GLYPHSCRUB_PROFILING_LEVEL >= 1
namespace detail
{

/**
 * @brief Logs how long a scope took on destruction.
 *
 * Scopes that process a known amount of text pass its size and get a throughput figure too,
 * which is what matters when comparing the cleaning passes on large inputs.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name, std::size_t bytes = 0) noexcept
        : name_(name)
        , bytes_(bytes)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        const auto micros =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();

        if (bytes_ == 0)
        {
            PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << micros << " us";
            return;
        }

        // bytes per microsecond == MB/s
        const double throughput = micros > 0 ? static_cast<double>(bytes_) / static_cast<double>(micros) : 0.0;
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << micros << " us for " << bytes_
                                           << " bytes (" << throughput << " MB/s)";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string_view name_;
    std::size_t bytes_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
#endif

} // namespace profiling

// PROFILE_SCOPE_FUNCTION()            times the enclosing function
// PROFILE_SCOPE_CUSTOM(name)          times the enclosing scope under `name` (must outlive the scope)
// PROFILE_SCOPE_TEXT(name, bytes)     same, and logs throughput over `bytes` of input

#if GLYPHSCRUB_PROFILING_LEVEL == 0

#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr) ((void)sizeof(nameExpr), (void)sizeof(bytesExpr))

#elif GLYPHSCRUB_PROFILING_LEVEL == 1

#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr, bytesExpr)

#else

#define PROFILE_SCOPE_FUNCTION()   \
    ZoneScopedN(__FUNCTION__);     \
    ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr)                                       \
    ZoneScoped;                                                              \
    ::profiling::detail::ScopeTimer __profiling_timer(nameExpr);             \
    {                                                                        \
        const std::string_view __profiling_name(nameExpr);                   \
        ZoneName(__profiling_name.data(), __profiling_name.size());          \
    }

#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr)                              \
    ZoneScoped;                                                              \
    ::profiling::detail::ScopeTimer __profiling_timer(nameExpr, bytesExpr);  \
    {                                                                        \
        const std::string_view __profiling_name(nameExpr);                   \
        ZoneName(__profiling_name.data(), __profiling_name.size());          \
        ZoneValue(static_cast<uint64_t>(bytesExpr));                         \
    }

#endif
