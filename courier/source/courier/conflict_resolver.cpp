#include <courier/conflict_resolver.hpp>
#include <courier/path_resolver.hpp>

#include <fmt/format.h>

namespace Courier
{
    ConflictResolver::ConflictResolver(Persistence::OverwritePolicy policy, std::shared_ptr<EventSink> events)
        : policy_{policy}
        , events_{std::move(events)}
    {}

    std::pair<std::string, std::string> ConflictResolver::splitExtension(std::string const& path)
    {
        const auto prefix = PathResolver::directoryPrefixOf(path);
        const auto name = PathResolver::fileNameOf(path);
        const auto dot = name.rfind('.');
        if (dot == std::string::npos)
            return {path, {}};
        return {prefix + name.substr(0, dot), name.substr(dot + 1)};
    }

    std::string
    ConflictResolver::candidateName(std::string const& path, Persistence::OverwritePolicy policy, unsigned long long counter)
    {
        const auto [base, extension] = splitExtension(path);
        if (extension.empty())
            return fmt::format("{}.{}", base, counter);
        if (policy == Persistence::OverwritePolicy::AddSuffixAfterExtension)
            return fmt::format("{}.{}.{}", base, extension, counter);
        return fmt::format("{}.{}.{}", base, counter, extension);
    }

    std::expected<std::string, Error>
    ConflictResolver::resolve(std::string const& desiredName, ExistenceCheck& check) const
    {
        using enum Persistence::OverwritePolicy;

        if (!check.exists(desiredName))
        {
            if (events_)
                events_->onConflictResolved(desiredName, desiredName, policy_);
            return desiredName;
        }

        switch (policy_)
        {
            case Never:
                return std::unexpected(Error{
                    .type = ErrorType::AlreadyExists,
                    .message = fmt::format("File already exists: {}", desiredName),
                });
            case Always:
                break;
            case AddSuffixBeforeExtension:
            case AddSuffixAfterExtension:
            {
                unsigned long long counter = 1;
                std::string candidate = candidateName(desiredName, policy_, counter);
                while (check.exists(candidate))
                    candidate = candidateName(desiredName, policy_, ++counter);
                if (events_)
                    events_->onConflictResolved(desiredName, candidate, policy_);
                return candidate;
            }
        }

        if (events_)
            events_->onConflictResolved(desiredName, desiredName, policy_);
        return desiredName;
    }
}
