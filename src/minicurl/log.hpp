#ifndef MINICURL_LOG_HPP
#define MINICURL_LOG_HPP

#include <cstdio>
#include <string>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

namespace minicurl {
namespace log {

enum class Level {
    Silent,   // nothing but the response
    Normal,   // errors and notices
    Verbose,  // connection and protocol traces
};

void SetLevel(Level level);
Level GetLevel();

// Traces go to stderr so stdout only ever carries the response.
template <typename... Args>
void Verbose(fmt::format_string<Args...> format, Args&&... args)
{
    if (GetLevel() != Level::Verbose) {
        return;
    }
    fmt::print(stderr, fmt::fg(fmt::color::steel_blue), "* {}\n",
               fmt::format(format, std::forward<Args>(args)...));
}

// One line of the wire exchange, prefixed with '>' (sent) or '<' (received).
void Wire(char direction, const std::string& line);

template <typename... Args>
void Notice(fmt::format_string<Args...> format, Args&&... args)
{
    if (GetLevel() == Level::Silent) {
        return;
    }
    fmt::print(stderr, "{}\n", fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void Error(fmt::format_string<Args...> format, Args&&... args)
{
    if (GetLevel() == Level::Silent) {
        return;
    }
    fmt::print(stderr, fmt::fg(fmt::color::red), "{}\n",
               fmt::format(format, std::forward<Args>(args)...));
}

} // namespace log
} // namespace minicurl

#endif // MINICURL_LOG_HPP
