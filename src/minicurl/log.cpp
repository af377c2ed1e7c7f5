#include "minicurl/log.hpp"

using namespace std;

namespace minicurl {
namespace log {

namespace {
Level current_level = Level::Normal;
}

void SetLevel(Level level)
{
    current_level = level;
}

Level GetLevel()
{
    return current_level;
}

void Wire(char direction, const string& line)
{
    if (current_level != Level::Verbose) {
        return;
    }
    fmt::print(stderr, fmt::fg(fmt::color::spring_green), "{} {}\n", direction, line);
}

} // namespace log
} // namespace minicurl
