#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace glyphscrub
{

/**
 * @brief Word -> synonyms dictionary consulted when synonym variation is on.
 *
 * Loaded from a JSON object whose values are a string or an array of strings:
 *   { "bad": ["awful", "poor"], "big": "large" }
 * Keys are looked up case-insensitively.
 */
class SynonymTable
{
public:
    SynonymTable() = default;

    /// Replaces the current contents with the file's. Returns false and keeps the table
    /// unchanged when the file is missing, unreadable or not a JSON object.
    bool loadFile(const std::string& file_path);

    void add(const std::string& word, const std::string& synonym);

    [[nodiscard]] const std::vector<std::string>& lookup(const std::string& word) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    static std::string makeKey(const std::string& word);

    std::unordered_map<std::string, std::vector<std::string>> entries_;
};

} // namespace glyphscrub
