#pragma once

#include <courier/error.hpp>
#include <courier/event_sink.hpp>
#include <courier/existence_check.hpp>
#include <persistence/state/transfer_options.hpp>

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace Courier
{
    /**
     * @brief Computes a name that does not collide with an existing one under an overwrite policy.
     */
    class ConflictResolver
    {
      public:
        ConflictResolver(Persistence::OverwritePolicy policy, std::shared_ptr<EventSink> events);

        /**
         * @brief Resolve a desired name.
         * Candidates for the suffix policies are generated and checked one at a time, the first free one wins.
         *
         * @param desiredName Full path of the destination.
         * @param check Local or remote existence check.
         * @return std::expected<std::string, Error> The name to use or AlreadyExists for the never policy.
         */
        std::expected<std::string, Error> resolve(std::string const& desiredName, ExistenceCheck& check) const;

        /**
         * @brief Splits the file name part of path into everything before the last dot and the extension (without
         * the dot). The directory part stays with the first element. "dir.d/file" has no extension.
         */
        static std::pair<std::string, std::string> splitExtension(std::string const& path);

        /**
         * @brief The candidate name for counter under a suffix policy.
         */
        static std::string
        candidateName(std::string const& path, Persistence::OverwritePolicy policy, unsigned long long counter);

      private:
        Persistence::OverwritePolicy policy_;
        std::shared_ptr<EventSink> events_;
    };
}
