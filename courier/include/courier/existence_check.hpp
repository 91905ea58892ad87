#pragma once

#include <string>

namespace Courier
{
    class TransportSession;

    /**
     * @brief Answers whether a name is taken, either locally or on the server.
     */
    class ExistenceCheck
    {
      public:
        virtual ~ExistenceCheck() = default;
        virtual bool exists(std::string const& name) = 0;
    };

    class LocalExistenceCheck : public ExistenceCheck
    {
      public:
        bool exists(std::string const& name) override;
    };

    /**
     * @brief Stats through the session. Errors count as "does not exist".
     */
    class RemoteExistenceCheck : public ExistenceCheck
    {
      public:
        explicit RemoteExistenceCheck(TransportSession& session);

        bool exists(std::string const& name) override;

      private:
        TransportSession* session_;
    };
}
