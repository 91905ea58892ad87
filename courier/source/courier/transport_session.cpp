#include <courier/transport_session.hpp>
#include <courier/host_identity_verifier.hpp>
#include <log/log.hpp>
#include <utility/file_access.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace Courier
{
    namespace
    {
        constexpr std::string_view keepAliveFailedReason = "keep alive failed";

        bool sendKeepAliveOn(Connection& connection, KeepAliveState& state, bool forced)
        {
            const auto now = KeepAliveState::Clock::now();
            if (!forced && !state.due(now))
                return true;
            if (connection.isClosed())
                return false;

            Log::trace("Sending keep alive");
            if (auto result = connection.session().sendKeepAlive(); !result)
            {
                Log::debug("Keep alive failed: {}", result.error().toString());
                return false;
            }
            state.markSent(now);
            return true;
        }
    }

    TransportSession::TransportSession(
        std::shared_ptr<SecureShell::ITransport> transport,
        Persistence::SessionOptions options,
        std::shared_ptr<EventSink> events)
        : mutex_{}
        , transport_{std::move(transport)}
        , options_{std::move(options)}
        , events_{events ? std::move(events) : std::make_shared<LoggingEventSink>()}
        , connection_{}
        , scheduler_{}
        , retiredSchedulers_{}
        , keepAlive_{options_.keepAliveInterval()}
        , state_{SessionState::Disconnected}
    {}

    TransportSession::~TransportSession()
    {
        disconnect();
    }

    std::expected<std::shared_ptr<Connection>, Error> TransportSession::getConnection()
    {
        auto connection = acquireConnection();
        joinRetiredSchedulers();
        return connection;
    }

    std::expected<std::shared_ptr<Connection>, Error> TransportSession::acquireConnection()
    {
        std::scoped_lock lock{mutex_};

        if (!connection_)
        {
            if (auto result = connectLocked(); !result)
                return std::unexpected(result.error());
            return connection_;
        }

        if (const auto reason = staleReason(*connection_); reason)
        {
            state_ = SessionState::Stale;
            if (*reason == keepAliveFailedReason)
                events_->onKeepAliveFailure(endpoint());
            events_->onReconnect(endpoint(), *reason);
            disconnectLocked();
            state_ = SessionState::Reconnecting;
            if (auto result = connectLocked(); !result)
                return std::unexpected(result.error());
        }
        return connection_;
    }

    std::optional<std::string> TransportSession::staleReason(Connection& connection)
    {
        if (connection.isClosed())
            return "connection was closed";
        if (connection.sftp().isClosed())
            return "sftp channel is closed";
        if (!connection.session().isConnected())
            return "session is not connected";
        if (connection.sftp().isEof())
            return "sftp channel reached EOF";
        if (!sendKeepAliveOn(connection, keepAlive_, false))
            return std::string{keepAliveFailedReason};
        return std::nullopt;
    }

    std::expected<void, Error> TransportSession::connect()
    {
        auto result = [this]() {
            std::scoped_lock lock{mutex_};
            return connectLocked();
        }();
        joinRetiredSchedulers();
        return result;
    }

    std::expected<void, Error> TransportSession::connectLocked()
    {
        const auto target = endpoint();
        if (state_ != SessionState::Reconnecting)
            state_ = SessionState::Connecting;
        events_->onConnectAttempt(target);

        auto connection = openConnection();
        if (!connection)
        {
            keepAlive_.forceNext();
            state_ = SessionState::Disconnected;
            Log::error("{}", connection.error().toString());
            return std::unexpected(connection.error());
        }

        retireScheduler();

        connection_ = std::move(connection).value();
        state_ = SessionState::Connected;

        if (!sendKeepAliveOn(*connection_, keepAlive_, true))
            Log::warn("Initial keep alive to '{}' failed", target);

        if (options_.keepAliveEnabled())
        {
            scheduler_ = std::make_unique<KeepAliveScheduler>(
                options_.keepAliveInterval(),
                [connection = connection_, this]() {
                    return sendKeepAliveOn(*connection, keepAlive_, false);
                },
                [events = events_, target, this]() {
                    keepAlive_.forceNext();
                    events->onKeepAliveFailure(target);
                });
            scheduler_->start();
        }

        events_->onConnected(target);
        return {};
    }

    std::expected<std::shared_ptr<Connection>, Error> TransportSession::openConnection()
    {
        const auto target = endpoint();
        const auto wrap = [&target](SecureShell::SftpError const& cause) {
            return Error{
                .type = ErrorType::ConnectionError,
                .message = fmt::format("Error while connecting to '{}'", target),
                .sftpError = cause,
            };
        };

        const bool useKey = options_.privateKeyFile && Utility::isReadableFile(*options_.privateKeyFile);
        const bool usePassword = !useKey && options_.password && !options_.password->empty();
        if (!useKey && !usePassword)
        {
            return std::unexpected(Error{
                .type = ErrorType::ConfigurationError,
                .message = "No credentials given for authentication",
            });
        }

        auto identity = resolveHostIdentity(options_.hostIdentityOptions, options_.host);
        if (!identity)
            return std::unexpected(identity.error());

        auto session = transport_->createSession(SecureShell::SessionParameters{
            .host = options_.host,
            .port = options_.effectivePort(),
            .user = options_.user,
            .connectTimeout = options_.effectiveConnectTimeout(),
        });
        if (!session)
            return std::unexpected(wrap(session.error()));
        auto& ssh = **session;

        if (auto result = ssh.connect(*identity); !result)
            return std::unexpected(wrap(result.error()));

        const auto dropSession = [&ssh]() {
            if (auto result = ssh.disconnect(); !result)
                Log::warn("Error while disconnecting: {}", result.error().toString());
        };

        if (useKey)
        {
            Log::debug("Using private key authentication with private key file '{}'", options_.privateKeyFile->string());
            if (auto result = ssh.authenticateWithPrivateKey(*options_.privateKeyFile, options_.privateKeyPassphrase);
                !result)
            {
                dropSession();
                return std::unexpected(wrap(result.error()));
            }
        }
        else
        {
            Log::debug("Using password authentication (hidden)");
            if (auto result = ssh.authenticateWithPassword(*options_.password); !result)
            {
                dropSession();
                return std::unexpected(wrap(result.error()));
            }
        }

        Log::debug("Creating sftp channel");
        auto sftp = ssh.openSftp();
        if (!sftp)
        {
            dropSession();
            return std::unexpected(wrap(sftp.error()));
        }

        return std::make_shared<Connection>(std::move(session).value(), std::move(sftp).value());
    }

    void TransportSession::disconnect()
    {
        {
            std::scoped_lock lock{mutex_};
            disconnectLocked();
        }
        joinRetiredSchedulers();
    }

    void TransportSession::disconnectLocked()
    {
        if (!connection_)
            return;

        Log::debug("Disconnecting from sftp server");
        retireScheduler();
        connection_->close();
        connection_.reset();
        keepAlive_.forceNext();
        state_ = SessionState::Disconnected;
        events_->onDisconnected(endpoint());
    }

    void TransportSession::retireScheduler()
    {
        if (!scheduler_)
            return;
        scheduler_->requestStop();
        retiredSchedulers_.push_back(std::move(scheduler_));
    }

    void TransportSession::joinRetiredSchedulers()
    {
        std::vector<std::unique_ptr<KeepAliveScheduler>> finished{};
        {
            std::scoped_lock lock{mutex_};
            // A keep alive thread that ends up here through its failure callback keeps its own scheduler alive.
            auto ownLoop = std::partition(
                retiredSchedulers_.begin(), retiredSchedulers_.end(), [](auto const& scheduler) {
                    return scheduler->isLoopThread();
                });
            std::move(ownLoop, retiredSchedulers_.end(), std::back_inserter(finished));
            retiredSchedulers_.erase(ownLoop, retiredSchedulers_.end());
        }
        for (auto& scheduler : finished)
            scheduler->stop();
    }

    std::expected<void, Error> TransportSession::reconnect()
    {
        auto result = [this]() {
            std::scoped_lock lock{mutex_};
            disconnectLocked();
            state_ = SessionState::Reconnecting;
            return connectLocked();
        }();
        joinRetiredSchedulers();
        return result;
    }

    bool TransportSession::sendKeepAlive(bool forced)
    {
        std::scoped_lock lock{mutex_};
        if (!connection_)
            return false;
        return sendKeepAliveOn(*connection_, keepAlive_, forced);
    }

    void TransportSession::noteTransportFailure(std::string const& context, SecureShell::SftpError const& cause)
    {
        Log::error("{} - {}", context, cause.toString());
        keepAlive_.forceNext();
    }

    Persistence::SessionOptions TransportSession::options() const
    {
        std::scoped_lock lock{mutex_};
        return options_;
    }

    bool TransportSession::isConnected() const
    {
        std::scoped_lock lock{mutex_};
        return connection_ != nullptr && !connection_->isClosed();
    }

    SessionState TransportSession::state() const
    {
        return state_.load();
    }

    bool TransportSession::keepAliveRunning() const
    {
        std::scoped_lock lock{mutex_};
        return scheduler_ && scheduler_->isRunning();
    }

    std::string TransportSession::endpoint() const
    {
        std::scoped_lock lock{mutex_};
        return fmt::format("{}@{}:{}", options_.user, options_.host, options_.effectivePort());
    }
}
