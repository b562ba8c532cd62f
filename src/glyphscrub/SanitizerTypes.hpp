#pragma once

#include "InvisibleCharacterRegistry.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace glyphscrub
{

// Core data contracts shared by the detector, the cleaner and their callers.
// Everything here is built per call from caller configuration.

// One switch per transformation; application order is fixed by the cleaner
struct CleaningOptions
{
    bool invisible_chars = true;
    bool markdown_headers = false;
    bool markdown_bold = false;
    bool repeating_chars = false;
    bool formatting_lines = false;
    bool extra_whitespace = false;
    bool word_exchanges = false;

    static CleaningOptions all()
    {
        return CleaningOptions{ true, true, true, true, true, true, true };
    }

    static CleaningOptions none()
    {
        return CleaningOptions{ false, false, false, false, false, false, false };
    }

    bool operator==(const CleaningOptions&) const = default;
};

// A bad -> good substitution rule
struct WordExchange
{
    std::string id;
    std::string bad_word;
    std::string good_word;
    bool enabled = true;

    bool operator==(const WordExchange&) const = default;
};

// Which surface forms of a bad word get matched during cleaning
struct VarianceSettings
{
    bool enabled = false;
    bool synonym_variation = false;
    bool case_variation = true;
    bool plural_variation = true;

    bool operator==(const VarianceSettings&) const = default;
};

// Match counts for the non-invisible passes
struct AdditionalCleaning
{
    std::size_t markdown_headers = 0;
    std::size_t markdown_bold = 0;
    std::size_t repeating_chars = 0;
    std::size_t formatting_lines = 0;
    std::size_t extra_whitespace = 0;
    std::size_t word_exchanges = 0;

    [[nodiscard]] std::size_t total() const noexcept
    {
        return markdown_headers + markdown_bold + repeating_chars + formatting_lines + extra_whitespace +
               word_exchanges;
    }
};

struct DetectionResult
{
    std::size_t total_count = 0;                                // Sum of `categories`
    std::array<std::size_t, kInvisibleCategoryCount> categories{}; // Indexed by categoryIndex()
    std::vector<std::size_t> positions;                         // UTF-16 code-unit offsets, ascending
    std::vector<std::size_t> byte_offsets;                      // UTF-8 offsets of the same hits
    std::optional<AdditionalCleaning> additional_cleaning;      // Absent when no extra pass was requested

    [[nodiscard]] std::size_t count(InvisibleCategory category) const noexcept
    {
        return categories[categoryIndex(category)];
    }

    [[nodiscard]] std::size_t categorySum() const noexcept
    {
        return std::accumulate(categories.begin(), categories.end(), std::size_t{ 0 });
    }
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                // The actual result payload
    bool succeeded = true;                   // Whether the stage completed successfully
    std::optional<std::string> error;        // Error message if stage failed
    std::chrono::microseconds duration{};    // How long the stage took to execute
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

} // namespace glyphscrub
