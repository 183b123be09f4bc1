#pragma once

#include <iostream>

namespace ansi
{
enum class color
{
    black = 30,
    red,
    green,
    yellow,
    blue,
    magenta,
    cyan,
    white,
};

// Switched off by --no-color; escapes are dropped when false.
inline bool enabled = true;

struct foreground
{
    color value;

    friend std::ostream& operator<<(std::ostream& os, const foreground& item)
    {
        if (enabled)
        {
            os << "\033[" << static_cast<int>(item.value) << "m";
        }
        return os;
    }
};

inline foreground fg(color value)
{
    return foreground{ value };
}

inline std::ostream& reset(std::ostream& os)
{
    if (enabled)
    {
        os << "\033[0m";
    }
    return os;
}

}  // namespace ansi
