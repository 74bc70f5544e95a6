// Utility helpers for timestamps and input validation.
#pragma once
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cctype>

// Returns local time in "YYYY-MM-DD HH:MM:SS" format.
inline std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t_c = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t_c, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Session keys: 1-64 characters of [A-Za-z0-9_.-].
inline bool isValidSessionId(const std::string &id)
{
    if (id.empty() || id.size() > 64)
        return false;
    for (unsigned char ch : id)
    {
        if (!(std::isalnum(ch) || ch == '_' || ch == '-' || ch == '.'))
            return false;
    }
    return true;
}

// Prompts may span lines but carry no other control characters.
inline bool isValidPrompt(const std::string &prompt, std::size_t maxLen = 8192)
{
    if (prompt.empty() || prompt.size() > maxLen)
        return false;
    for (unsigned char ch : prompt)
    {
        if (std::iscntrl(ch) && ch != '\n' && ch != '\t')
            return false;
    }
    return true;
}
