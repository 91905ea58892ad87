#include <utility/random_string.hpp>

#include <random>
#include <string_view>

namespace Utility
{
    namespace
    {
        constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

        std::mt19937& generator()
        {
            thread_local std::mt19937 rng{std::random_device{}()};
            return rng;
        }
    }

    std::string randomAlphanumeric(std::size_t length)
    {
        std::uniform_int_distribution<std::size_t> distribution(0, alphabet.size() - 1);

        std::string result;
        result.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
            result.push_back(alphabet[distribution(generator())]);
        return result;
    }
}
