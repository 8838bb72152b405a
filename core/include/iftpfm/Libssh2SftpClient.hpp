#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types (leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace iftpfm {

// SFTP has no server-side working directory: the client keeps one and
// prefixes every relative name with it.
class Libssh2SftpClient : public RemoteClient {
public:
    explicit Libssh2SftpClient(ClientOptions opt = {});
    ~Libssh2SftpClient() override;

    Protocol protocol() const override { return Protocol::Sftp; }

    bool connect(const std::string& host,
                 std::uint16_t port,
                 std::chrono::milliseconds timeout,
                 ClientError& err) override;
    bool login(const std::string& user,
               const Credential& cred,
               ClientError& err) override;
    bool setBinaryMode(ClientError& err) override;
    void close() override;
    bool isConnected() const override { return session_ != nullptr; }

    bool changeDirectory(const std::string& path, ClientError& err) override;
    std::string currentDirectory() const override { return cwd_; }

    bool list(std::vector<std::string>& out, ClientError& err) override;
    bool modTime(const std::string& name, std::int64_t& mtime, ClientError& err) override;
    bool size(const std::string& name, std::uint64_t& bytes, ClientError& err) override;
    bool download(const std::string& name, ByteSink& sink, ClientError& err) override;
    bool upload(const std::string& name, ByteSource& source, ClientError& err) override;
    bool rename(const std::string& from, const std::string& to, ClientError& err) override;
    bool remove(const std::string& name, ClientError& err) override;

    std::string fullPath(const std::string& name) const { return joinRemotePath(cwd_, name); }

private:
    ClientOptions opt_;
    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP* sftp_ = nullptr;
    std::string host_;
    std::uint16_t port_ = 22;
    std::string cwd_ = "/";

    bool tcpConnect(const std::string& host, std::uint16_t port,
                    std::chrono::steady_clock::time_point deadline,
                    std::chrono::milliseconds timeout, ClientError& err);
    bool verifyHostKey(ClientError& err);
    bool requireSftp(ClientError& err) const;
    std::string lastSessionError() const;
    void sftpFailure(ClientError& err, const std::string& what, const std::string& path) const;
};

} // namespace iftpfm
