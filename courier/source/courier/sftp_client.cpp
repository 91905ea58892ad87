#include <courier/sftp_client.hpp>
#include <log/log.hpp>
#include <ssh/libssh_transport.hpp>

namespace Courier
{
    namespace
    {
        std::shared_ptr<EventSink> orLoggingSink(std::shared_ptr<EventSink> events)
        {
            if (events)
                return events;
            return std::make_shared<LoggingEventSink>();
        }
    }

    SftpClient::SftpClient(Persistence::SessionOptions options, std::shared_ptr<EventSink> events)
        : SftpClient{std::make_shared<SecureShell::LibsshTransport>(), std::move(options), std::move(events)}
    {}

    SftpClient::SftpClient(
        std::shared_ptr<SecureShell::ITransport> transport,
        Persistence::SessionOptions options,
        std::shared_ptr<EventSink> events)
        : events_{orLoggingSink(std::move(events))}
        , session_{std::move(transport), std::move(options), events_}
        , transfers_{session_, events_}
        , directories_{transfers_}
    {
        if (session_.options().privateKeyFile)
            Log::info("Created sftp client '{}' with private key file and passphrase (hidden)", session_.endpoint());
        else
            Log::info("Created sftp client '{}'", session_.endpoint());
    }

    SftpClient::~SftpClient()
    {
        session_.disconnect();
    }

    std::expected<void, Error> SftpClient::setTimeout(std::chrono::milliseconds timeout)
    {
        return session_.whileDisconnected([timeout](Persistence::SessionOptions& options) {
            options.connectTimeoutMilliseconds = timeout.count() < 0 ? Persistence::Defaults::connectTimeout.count()
                                                                     : timeout.count();
        });
    }

    void SftpClient::setStrictMode(bool strictMode)
    {
        session_.updateOptions([strictMode](Persistence::SessionOptions& options) {
            options.transferOptions.strictMode = strictMode;
        });
    }

    void SftpClient::setOverwritePolicy(Persistence::OverwritePolicy policy)
    {
        session_.updateOptions([policy](Persistence::SessionOptions& options) {
            options.transferOptions.overwritePolicy = policy;
        });
    }

    void SftpClient::setTransactional(bool transactional)
    {
        session_.updateOptions([transactional](Persistence::SessionOptions& options) {
            options.transferOptions.transactional = transactional;
        });
    }

    void SftpClient::setCreateDirectoriesAutomatically(bool createDirectories)
    {
        session_.updateOptions([createDirectories](Persistence::SessionOptions& options) {
            options.transferOptions.createDirectoriesAutomatically = createDirectories;
        });
    }

    std::expected<void, Error> SftpClient::disableKeepAlive()
    {
        return session_.whileDisconnected([](Persistence::SessionOptions& options) {
            options.keepAliveOptions.enabled = false;
            options.keepAliveOptions.intervalMilliseconds = Persistence::Defaults::keepAliveInterval.count();
        });
    }

    std::expected<void, Error> SftpClient::enableKeepAlive(std::chrono::milliseconds interval)
    {
        return session_.whileDisconnected([interval](Persistence::SessionOptions& options) {
            options.keepAliveOptions.enabled = true;
            options.keepAliveOptions.intervalMilliseconds = interval.count();
        });
    }

    std::expected<void, Error> SftpClient::setHostKeyCheckDisabled(bool disabled)
    {
        return session_.whileDisconnected([disabled](Persistence::SessionOptions& options) {
            options.hostIdentityOptions.disableCheck = disabled;
        });
    }

    std::expected<void, Error> SftpClient::setHostKey(std::string const& base64Key, SecureShell::HostKeyType type)
    {
        return session_.whileDisconnected([&base64Key, type](Persistence::SessionOptions& options) {
            options.hostIdentityOptions.hostKey = base64Key;
            options.hostIdentityOptions.hostKeyType = std::string{SecureShell::hostKeyTypeName(type)};
            options.hostIdentityOptions.disableCheck = false;
        });
    }

    std::expected<void, Error> SftpClient::setKnownHostsFile(std::filesystem::path const& knownHostsFile)
    {
        return session_.whileDisconnected([&knownHostsFile](Persistence::SessionOptions& options) {
            options.hostIdentityOptions.knownHostsFile = knownHostsFile;
            options.hostIdentityOptions.disableCheck = false;
        });
    }

    Persistence::SessionOptions SftpClient::options() const
    {
        return session_.options();
    }

    std::expected<void, Error> SftpClient::connect()
    {
        if (session_.isConnected())
            return {};
        return session_.connect();
    }

    void SftpClient::disconnect()
    {
        session_.disconnect();
    }

    bool SftpClient::isConnected() const
    {
        return session_.isConnected();
    }

    std::expected<void, Error>
    SftpClient::uploadFile(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        return transfers_.uploadFile(remotePath, localPath);
    }

    std::expected<void, Error> SftpClient::uploadStream(std::string const& remotePath, std::istream& source)
    {
        return transfers_.uploadStream(remotePath, source);
    }

    std::expected<void, Error> SftpClient::uploadData(std::string const& remotePath, std::string const& data)
    {
        return transfers_.uploadData(remotePath, data);
    }

    std::expected<void, Error>
    SftpClient::uploadFiles(std::string const& remoteFolder, std::vector<std::filesystem::path> const& localFiles)
    {
        return directories_.uploadFiles(remoteFolder, localFiles);
    }

    std::expected<void, Error>
    SftpClient::downloadFile(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        return transfers_.downloadFile(remotePath, localPath);
    }

    std::expected<void, Error> SftpClient::downloadStream(std::string const& remotePath, std::ostream& sink)
    {
        return transfers_.downloadStream(remotePath, sink);
    }

    std::expected<std::string, Error> SftpClient::downloadData(std::string const& remotePath)
    {
        return transfers_.downloadData(remotePath);
    }

    std::expected<void, Error> SftpClient::downloadFiles(
        std::string const& remoteFolder,
        std::filesystem::path const& localFolder,
        std::string const& wildcard)
    {
        return directories_.downloadFiles(remoteFolder, localFolder, wildcard);
    }

    std::expected<void, Error> SftpClient::renameRemoteFile(std::string const& oldPath, std::string const& newPath)
    {
        return transfers_.renameRemoteFile(oldPath, newPath);
    }

    std::expected<void, Error> SftpClient::deleteRemoteFile(std::string const& remotePath)
    {
        return transfers_.deleteRemoteFile(remotePath);
    }

    std::expected<std::optional<RemoteFile>, Error> SftpClient::statRemoteFile(std::string const& remotePath)
    {
        return transfers_.statRemoteFile(remotePath);
    }

    std::expected<bool, Error> SftpClient::remoteFileExists(std::string const& remotePath)
    {
        return transfers_.remoteFileExists(remotePath);
    }

    std::expected<std::vector<RemoteFile>, Error>
    SftpClient::listFiles(std::string const& remoteFolder, std::string const& wildcard)
    {
        return directories_.listFiles(remoteFolder, wildcard);
    }

    std::expected<void, Error> SftpClient::createFolder(std::string const& remoteFolder)
    {
        return directories_.createFolder(remoteFolder);
    }

    std::expected<void, Error> SftpClient::deleteFolder(std::string const& remoteFolder)
    {
        return directories_.deleteFolder(remoteFolder);
    }

    std::expected<void, Error> SftpClient::deleteFiles(std::string const& remoteFolder, std::string const& wildcard)
    {
        return directories_.deleteFiles(remoteFolder, wildcard);
    }

    std::expected<void, Error> SftpClient::moveFiles(
        std::string const& sourceFolder,
        std::string const& destinationFolder,
        std::string const& wildcard)
    {
        return directories_.moveFiles(sourceFolder, destinationFolder, wildcard);
    }
}
