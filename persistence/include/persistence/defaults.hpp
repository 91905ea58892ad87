#pragma once

#include <chrono>

namespace Persistence::Defaults
{
    constexpr int port = 22;
    constexpr std::chrono::milliseconds connectTimeout{30'000};
    constexpr bool strictMode = true;
    constexpr bool transactional = true;
    constexpr bool createDirectoriesAutomatically = false;
    constexpr bool keepAlive = false;
    constexpr std::chrono::milliseconds keepAliveInterval{5'000};
    constexpr bool disableHostKeyCheck = false;
}
