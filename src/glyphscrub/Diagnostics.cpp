#include "Diagnostics.hpp"
#include "InvisibleCharacterRegistry.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <plog/Log.h>

namespace glyphscrub
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::Configure(bool verbose, std::size_t max_preview) noexcept
{
    verbose_.store(verbose, std::memory_order_relaxed);
    max_preview_.store(max_preview == 0 ? 1 : max_preview, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    const auto& registry = InvisibleCharacterRegistry::instance();

    std::string out;
    out.reserve(std::min(text.size(), limit) + 16);

    std::size_t pos = 0;
    while (pos < text.size() && pos < limit)
    {
        Utf8Unit unit = decodeUtf8At(text, pos);
        char buf[16];

        if (!unit.valid)
        {
            std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(static_cast<unsigned char>(text[pos])));
            out += buf;
        }
        else if (unit.codepoint == U'\n')
        {
            out += "\\n";
        }
        else if (unit.codepoint == U'\r')
        {
            out += "\\r";
        }
        else if (unit.codepoint == U'\t')
        {
            out += "\\t";
        }
        else if (unit.codepoint < 0x20)
        {
            out.push_back('?');
        }
        else if (registry.isInvisible(unit.codepoint))
        {
            std::snprintf(buf, sizeof(buf), "<U+%04X>", static_cast<std::uint32_t>(unit.codepoint));
            out += buf;
        }
        else
        {
            out.append(text.substr(pos, unit.length));
        }
        pos += unit.length;
    }

    if (text.size() > pos)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    return out;
}

void Diagnostics::TraceText(std::string_view component, std::string_view label, std::string_view text)
{
    if (!IsVerbose())
        return;
    PLOG_INFO_(kLogInstance) << "[" << component << "] " << label << "=" << Preview(text);
}

void Diagnostics::TraceStage(std::string_view component, std::string_view stage, std::string_view before,
                             std::string_view after, std::chrono::microseconds duration)
{
    if (!IsVerbose())
        return;

    if (before == after)
    {
        PLOG_DEBUG_(kLogInstance) << "[" << component << "] stage=" << stage << " status=unchanged duration="
                                  << duration.count() << "us";
        return;
    }

    const std::size_t invisible_before = countInvisible(before);
    const std::size_t invisible_after = countInvisible(after);

    PLOG_INFO_(kLogInstance) << "[" << component << "] stage=" << stage << " status=ok duration=" << duration.count()
                             << "us bytes=" << before.size() << "->" << after.size()
                             << (invisible_before > invisible_after
                                     ? " invisible_removed=" + std::to_string(invisible_before - invisible_after)
                                     : std::string())
                             << " output=" << Preview(after);
}

void Diagnostics::TraceFailure(std::string_view component, std::string_view stage, std::string_view reason,
                               std::chrono::microseconds duration)
{
    if (!IsVerbose())
        return;
    PLOG_ERROR_(kLogInstance) << "[" << component << "] stage=" << stage << " status=error duration="
                              << duration.count() << "us reason=" << reason << " -> keeping previous text";
}

std::size_t Diagnostics::countInvisible(std::string_view text)
{
    const auto& registry = InvisibleCharacterRegistry::instance();
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        Utf8Unit unit = decodeUtf8At(text, pos);
        if (unit.valid && registry.isInvisible(unit.codepoint))
            ++count;
        pos += unit.length;
    }
    return count;
}

} // namespace glyphscrub
