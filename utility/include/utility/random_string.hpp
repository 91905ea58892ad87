#pragma once

#include <cstddef>
#include <string>

namespace Utility
{
    /**
     * @brief Generates a string of [A-Za-z0-9] characters. Thread safe.
     *
     * @param length Number of characters.
     */
    std::string randomAlphanumeric(std::size_t length);
}
