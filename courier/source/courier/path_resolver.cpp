#include <courier/path_resolver.hpp>
#include <utility/wildcard.hpp>

#include <fmt/format.h>

namespace Courier::PathResolver
{
    std::optional<std::string> parentOf(std::string_view path)
    {
        const auto pos = path.rfind(separator);
        if (pos == std::string_view::npos)
            return std::nullopt;
        return std::string{path.substr(0, pos)};
    }

    std::string fileNameOf(std::string_view path)
    {
        const auto pos = path.rfind(separator);
        if (pos == std::string_view::npos)
            return std::string{path};
        return std::string{path.substr(pos + 1)};
    }

    std::string directoryPrefixOf(std::string_view path)
    {
        const auto pos = path.rfind(separator);
        if (pos == std::string_view::npos)
            return {};
        return std::string{path.substr(0, pos + 1)};
    }

    std::string join(std::string_view folder, std::string_view name)
    {
        while (!name.empty() && name.front() == separator)
            name.remove_prefix(1);

        if (!folder.empty() && folder.back() == separator)
            return fmt::format("{}{}", folder, name);
        return fmt::format("{}{}{}", folder, separator, name);
    }

    std::expected<std::string, Error> validateWildcard(std::string_view pattern)
    {
        if (pattern.empty())
            return std::string{"*"};
        if (pattern.find(separator) != std::string_view::npos)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConfigurationError,
                .message = fmt::format("Invalid wildcard: {}", pattern),
            });
        }
        return std::string{pattern};
    }

    bool matchesWildcard(std::string_view name, std::string_view pattern)
    {
        return Utility::matchesWildcard(name, pattern);
    }
}
