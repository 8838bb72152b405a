// Abstract interface for remote file storage. The FTP, FTPS and SFTP backends
// implement it so the transfer pipeline stays independent of the wire protocol.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace iftpfm {

// Destination for downloaded bytes.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(const char* data, std::size_t len, std::string& err) = 0;
};

// Source of bytes to upload. read() returns 0 at end of data; on failure it
// returns 0 and fills err.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t read(char* data, std::size_t len, std::string& err) = 0;
    virtual std::uint64_t size() const = 0;
};

class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    virtual Protocol protocol() const = 0;

    // Session setup. The timeout bounds the whole handshake, not only TCP.
    virtual bool connect(const std::string& host,
                         std::uint16_t port,
                         std::chrono::milliseconds timeout,
                         ClientError& err) = 0;
    virtual bool login(const std::string& user,
                       const Credential& cred,
                       ClientError& err) = 0;
    virtual bool setBinaryMode(ClientError& err) = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    // Working directory. Relative names passed to the methods below resolve
    // against it.
    virtual bool changeDirectory(const std::string& path, ClientError& err) = 0;
    virtual std::string currentDirectory() const = 0;

    // Plain file names in the current directory (no recursion).
    virtual bool list(std::vector<std::string>& out, ClientError& err) = 0;

    // Modification time in seconds since the epoch (UTC).
    virtual bool modTime(const std::string& name,
                         std::int64_t& mtime,
                         ClientError& err) = 0;
    virtual bool size(const std::string& name,
                      std::uint64_t& bytes,
                      ClientError& err) = 0;

    virtual bool download(const std::string& name,
                          ByteSink& sink,
                          ClientError& err) = 0;
    virtual bool upload(const std::string& name,
                        ByteSource& source,
                        ClientError& err) = 0;

    // Fails when the target exists on backends without atomic overwrite.
    virtual bool rename(const std::string& from,
                        const std::string& to,
                        ClientError& err) = 0;
    virtual bool remove(const std::string& name, ClientError& err) = 0;
};

using ClientFactory = std::function<std::unique_ptr<RemoteClient>(Protocol)>;

// Creates the concrete backend for a protocol.
std::unique_ptr<RemoteClient> makeRemoteClient(Protocol p, const ClientOptions& opt);

// Factory bound to run-wide options; what the scheduler uses outside tests.
ClientFactory defaultClientFactory(const ClientOptions& opt);

// Joins a directory and a name. Absolute names are returned unchanged.
std::string joinRemotePath(const std::string& dir, const std::string& name);

} // namespace iftpfm
