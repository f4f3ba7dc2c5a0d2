#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

inline std::string trim_copy(std::string_view sv)
{
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    std::string s(sv);
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

inline std::string lower_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::vector<std::string> split_copy(std::string_view s, char sep)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(s.substr(start));
            break;
        }
        out.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

inline bool parse_int64(std::string_view s, std::int64_t* out)
{
    std::string t = trim_copy(s);
    if (t.empty()) return false;

    std::size_t i = 0;
    if (t[0] == '+' || t[0] == '-') i = 1;
    if (i == t.size()) return false;

    for (; i < t.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) return false;
    }

    try {
        const long long v = std::stoll(t);
        *out = static_cast<std::int64_t>(v);
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

inline bool parse_double(std::string_view s, double* out)
{
    std::string t = trim_copy(s);
    if (t.empty()) return false;

    try {
        std::size_t pos = 0;
        const double v = std::stod(t, &pos);
        if (pos != t.size()) return false;
        *out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}
