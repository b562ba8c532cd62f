#pragma once

#include "SanitizerTypes.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>
#include <new>

#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace glyphscrub {

// Utility to run a stage (callable returning T) and produce StageResult<T>
// Measures duration and logs errors. Keeps cleaning steps consistent for pipeline tracing.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    try
    {
        T res = fn();
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        auto sr = StageResult<T>::success(std::move(res), dur, stage_name);
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return sr;
    }
    catch (const std::bad_alloc& ex)
    {
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' ran out of memory after " << dur.count() << "us";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Sanitizer,
            "Text too large for a cleaning step; the step was skipped",
            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Sanitizer,
            "Text cleaning step failed",
            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace glyphscrub
