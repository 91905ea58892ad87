#pragma once

#include <courier/error.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Stateless helpers over '/' separated remote path strings. No I/O.
 */
namespace Courier::PathResolver
{
    constexpr char separator = '/';

    /**
     * @brief Everything before the last separator, std::nullopt if there is none.
     * parentOf("/a/b/c") == "/a/b", parentOf("/a") == "" (the root), parentOf("a") == std::nullopt.
     */
    std::optional<std::string> parentOf(std::string_view path);

    /**
     * @brief Everything after the last separator, the whole path if there is none.
     */
    std::string fileNameOf(std::string_view path);

    /**
     * @brief Everything up to and including the last separator, empty if there is none.
     */
    std::string directoryPrefixOf(std::string_view path);

    /**
     * @brief Joins folder and name with exactly one separator. An empty folder is the root.
     */
    std::string join(std::string_view folder, std::string_view name);

    /**
     * @brief An empty pattern becomes "*". A pattern with a separator in it is rejected with ConfigurationError.
     */
    std::expected<std::string, Error> validateWildcard(std::string_view pattern);

    bool matchesWildcard(std::string_view name, std::string_view pattern);
}
