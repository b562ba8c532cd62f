#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace glyphscrub
{

// Verbose tracing of detection and cleaning, written to plog instance kLogInstance
// (diagnostics.log). Everything here is a no-op unless verbose mode is on.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // A zero preview length is treated as 1
    static void Configure(bool verbose, std::size_t max_preview) noexcept;

    [[nodiscard]] static bool IsVerbose() noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Log-safe rendering: control characters escaped, invisible code points spelled out as
    // <U+XXXX>, malformed bytes as \xNN, cut after MaxPreview() bytes.
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "[Cleaner] input=..."
    static void TraceText(std::string_view component, std::string_view label, std::string_view text);

    // One line per stage: byte sizes before and after, invisible code points removed, and a
    // preview of the result. Stages that left the text alone are logged as unchanged.
    static void TraceStage(std::string_view component, std::string_view stage, std::string_view before,
                           std::string_view after, std::chrono::microseconds duration);

    static void TraceFailure(std::string_view component, std::string_view stage, std::string_view reason,
                             std::chrono::microseconds duration);

private:
    static std::size_t countInvisible(std::string_view text);

    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace glyphscrub
