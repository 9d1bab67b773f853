#ifndef RBSET_UTIL_PRINT_HPP
#define RBSET_UTIL_PRINT_HPP

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace rbset
{
namespace util
{

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Replaces each "{...}" with the next argument; surplus placeholders
// are dropped, surplus arguments ignored.
template <typename... Args>
std::string format(const std::string& template_str, const Args&... args)
{
    std::ostringstream stream;
    std::vector<std::string> arg_list = {to_string(args)...};

    size_t start_pos = 0;
    size_t arg_index = 0;
    while (start_pos < template_str.size())
    {
        size_t open_brace = template_str.find('{', start_pos);
        if (open_brace == std::string::npos)
        {
            stream << template_str.substr(start_pos);
            break;
        }
        size_t close_brace = template_str.find('}', open_brace);
        if (close_brace == std::string::npos)
        {
            stream << template_str.substr(start_pos);
            break;
        }

        stream << template_str.substr(start_pos, open_brace - start_pos);

        if (arg_index < arg_list.size())
        {
            stream << arg_list[arg_index++];
        }

        start_pos = close_brace + 1;
    }

    return stream.str();
}

}  // namespace detail

template <typename... Args>
std::string format(const std::string& message, const Args&... args)
{
    return detail::format(message, args...);
}

template <typename... Args>
void println(const std::string& message, const Args&... args)
{
    std::cout << detail::format(message, args...) << std::endl;
}

enum class level : int
{
    debug,
    info,
    warning,
    error,
    off
};

inline const char* to_string(level l) noexcept
{
    switch (l)
    {
    case level::debug:   return "debug";
    case level::info:    return "info";
    case level::warning: return "warn";
    case level::error:   return "error";
    case level::off:     return "off";
    }
    return "?";
}

// Accepts the names produced by to_string(level); anything else yields
// `fallback`.
inline level parse_level(const char* text, level fallback) noexcept
{
    if (text == nullptr) return fallback;
    if (std::strcmp(text, "debug") == 0) return level::debug;
    if (std::strcmp(text, "info") == 0) return level::info;
    if (std::strcmp(text, "warn") == 0) return level::warning;
    if (std::strcmp(text, "error") == 0) return level::error;
    if (std::strcmp(text, "off") == 0) return level::off;
    return fallback;
}

namespace detail
{

// RBSET_LOG_LEVEL is read once, on first use.
inline std::atomic<level>& threshold() noexcept
{
    static std::atomic<level> current{parse_level(std::getenv("RBSET_LOG_LEVEL"), level::info)};
    return current;
}

}  // namespace detail

inline level log_level() noexcept { return detail::threshold().load(std::memory_order_relaxed); }

inline void set_log_level(level l) noexcept { detail::threshold().store(l, std::memory_order_relaxed); }

inline bool log_enabled(level l) noexcept
{
    return l != level::off && static_cast<int>(l) >= static_cast<int>(log_level());
}

template <typename... Args>
void log(level l, const std::string& message, const Args&... args)
{
    if (!log_enabled(l)) return;
    std::clog << '[' << to_string(l) << "] " << detail::format(message, args...) << '\n';
}

}  // namespace util
}  // namespace rbset

#endif  // RBSET_UTIL_PRINT_HPP
