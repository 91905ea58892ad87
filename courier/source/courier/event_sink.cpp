#include <courier/event_sink.hpp>
#include <log/log.hpp>

namespace Courier
{
    void LoggingEventSink::onConnectAttempt(std::string const& endpoint)
    {
        Log::debug("Connecting to '{}'", endpoint);
    }
    void LoggingEventSink::onConnected(std::string const& endpoint)
    {
        Log::info("Connected to '{}'", endpoint);
    }
    void LoggingEventSink::onDisconnected(std::string const& endpoint)
    {
        Log::debug("Disconnected from '{}'", endpoint);
    }
    void LoggingEventSink::onReconnect(std::string const& endpoint, std::string const& reason)
    {
        Log::warn("Reconnecting to '{}': {}", endpoint, reason);
    }
    void LoggingEventSink::onKeepAliveFailure(std::string const& endpoint)
    {
        Log::warn("Connection lost: keep alive to '{}' failed", endpoint);
    }
    void LoggingEventSink::onConflictResolved(
        std::string const& requested,
        std::string const& resolved,
        Persistence::OverwritePolicy policy)
    {
        if (requested == resolved)
            Log::debug("No name conflict for '{}' (policy {})", requested, Persistence::overwritePolicyToString(policy));
        else
            Log::info(
                "Name conflict for '{}' resolved to '{}' (policy {})",
                requested,
                resolved,
                Persistence::overwritePolicyToString(policy));
    }
    void LoggingEventSink::onTransferState(std::string const& target, TransferState state)
    {
        if (state == TransferState::Failed)
            Log::warn("Transfer of '{}' failed", target);
        else
            Log::trace("Transfer of '{}': {}", target, transferStateToString(state));
    }
}
