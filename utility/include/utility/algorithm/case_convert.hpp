#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed ASCII string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return input;
    }

    inline std::string toUpperCase(std::string input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return input;
    }
}
