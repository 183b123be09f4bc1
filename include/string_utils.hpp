#pragma once

#include <algorithm>
#include <cctype>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace scicalc
{
inline bool is_space(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch));
}

inline std::string_view drop(std::string_view text, std::ptrdiff_t n)
{
    text.remove_prefix(std::min(n, static_cast<std::ptrdiff_t>(text.size())));
    return text;
}

inline std::string_view drop_last(std::string_view text, std::ptrdiff_t n)
{
    text.remove_suffix(std::min(n, static_cast<std::ptrdiff_t>(text.size())));
    return text;
}

inline std::string_view trim(std::string_view text, const std::function<bool(char)>& pred)
{
    while (!text.empty() && pred(text.front()))
    {
        text = drop(text, 1);
    }
    while (!text.empty() && pred(text.back()))
    {
        text = drop_last(text, 1);
    }
    return text;
}

inline std::string_view trim_whitespace(std::string_view text)
{
    return trim(text, is_space);
}

// Removes every whitespace character, including the ones between digits.
inline std::string strip_whitespace(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result), [](char ch) { return !is_space(ch); });
    return result;
}

inline std::vector<std::string_view> split_whitespace(std::string_view text)
{
    std::vector<std::string_view> result;
    text = trim_whitespace(text);
    while (!text.empty())
    {
        const auto it = std::find_if(text.begin(), text.end(), is_space);
        const auto size = static_cast<std::size_t>(it - text.begin());
        result.push_back(text.substr(0, size));
        text = trim_whitespace(drop(text, static_cast<std::ptrdiff_t>(size)));
    }
    return result;
}

inline bool starts_with(std::string_view haystack, std::string_view needle)
{
    return haystack.substr(0, std::min(haystack.size(), needle.size())) == needle;
}

}  // namespace scicalc
