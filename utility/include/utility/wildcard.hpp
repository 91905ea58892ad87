#pragma once

#include <string_view>

namespace Utility
{
    /**
     * @brief Matches a file name against a glob pattern. '*' matches any sequence (including none), '?' exactly one
     * character. Everything else is literal and case sensitive.
     */
    bool matchesWildcard(std::string_view name, std::string_view pattern);
}
