#include "SynonymTable.hpp"
#include "Diagnostics.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace glyphscrub
{

bool SynonymTable::loadFile(const std::string& file_path)
{
    if (!fs::exists(file_path))
    {
        PLOG_WARNING << "[SynonymTable] Synonym file not found: " << file_path;
        return false;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        PLOG_ERROR << "[SynonymTable] Failed to open synonym file: " << file_path;
        return false;
    }

    try
    {
        json j;
        file >> j;

        if (!j.is_object())
        {
            PLOG_ERROR << "[SynonymTable] Invalid JSON format (expected object): " << file_path;
            return false;
        }

        SynonymTable loaded;
        for (auto& [word, value] : j.items())
        {
            if (value.is_string())
            {
                loaded.add(word, value.get<std::string>());
            }
            else if (value.is_array())
            {
                for (const auto& item : value)
                {
                    if (item.is_string())
                        loaded.add(word, item.get<std::string>());
                    else
                        PLOG_WARNING << "[SynonymTable] Skipping non-string synonym for key: " << word;
                }
            }
            else
            {
                PLOG_WARNING << "[SynonymTable] Skipping non-string entry for key: " << word;
            }
        }

        entries_ = std::move(loaded.entries_);
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << "[SynonymTable] Loaded " << entries_.size() << " words from "
                                                  << file_path;
        return true;
    }
    catch (const json::exception& e)
    {
        PLOG_ERROR << "[SynonymTable] JSON parse error in " << file_path << ": " << e.what();
        return false;
    }
}

void SynonymTable::add(const std::string& word, const std::string& synonym)
{
    std::string key = makeKey(word);
    std::string value = trim_whitespace(synonym);
    if (key.empty() || value.empty())
        return;

    auto& list = entries_[key];
    if (std::find(list.begin(), list.end(), value) == list.end())
        list.push_back(std::move(value));
}

const std::vector<std::string>& SynonymTable::lookup(const std::string& word) const
{
    static const std::vector<std::string> none;
    auto it = entries_.find(makeKey(word));
    return it == entries_.end() ? none : it->second;
}

std::string SynonymTable::makeKey(const std::string& word)
{
    std::string trimmed = trim_whitespace(word);
    return utf32ToUtf8(toLower(utf8ToUtf32(trimmed)));
}

} // namespace glyphscrub
