#include <utility/wildcard.hpp>

#include <cstddef>

namespace Utility
{
    bool matchesWildcard(std::string_view name, std::string_view pattern)
    {
        std::size_t n = 0;
        std::size_t p = 0;
        std::size_t starPattern = std::string_view::npos;
        std::size_t starName = 0;

        while (n < name.size())
        {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n]))
            {
                ++n;
                ++p;
            }
            else if (p < pattern.size() && pattern[p] == '*')
            {
                starPattern = p++;
                starName = n;
            }
            else if (starPattern != std::string_view::npos)
            {
                // let the last star swallow one more character
                p = starPattern + 1;
                n = ++starName;
            }
            else
                return false;
        }

        while (p < pattern.size() && pattern[p] == '*')
            ++p;

        return p == pattern.size();
    }
}
