// libcurl backends for plain FTP and explicit FTPS (AUTH TLS).
#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

typedef void CURL;
struct curl_slist;

namespace iftpfm {

// One easy handle per session so libcurl reuses the control connection.
// libcurl sends USER/PASS while establishing that connection, so connect()
// only records the endpoint and login() performs the first round-trip
// (TCP, greeting, TLS, USER/PASS), bounded as a whole by the connect timeout.
class CurlFtpClient : public RemoteClient {
public:
    CurlFtpClient();
    ~CurlFtpClient() override;
    CurlFtpClient(const CurlFtpClient&) = delete;
    CurlFtpClient& operator=(const CurlFtpClient&) = delete;

    Protocol protocol() const override { return Protocol::Ftp; }

    bool connect(const std::string& host,
                 std::uint16_t port,
                 std::chrono::milliseconds timeout,
                 ClientError& err) override;
    bool login(const std::string& user,
               const Credential& cred,
               ClientError& err) override;
    bool setBinaryMode(ClientError& err) override;
    void close() override;
    bool isConnected() const override { return loggedIn_; }

    bool changeDirectory(const std::string& path, ClientError& err) override;
    std::string currentDirectory() const override { return cwd_; }

    bool list(std::vector<std::string>& out, ClientError& err) override;
    bool modTime(const std::string& name, std::int64_t& mtime, ClientError& err) override;
    bool size(const std::string& name, std::uint64_t& bytes, ClientError& err) override;
    bool download(const std::string& name, ByteSink& sink, ClientError& err) override;
    bool upload(const std::string& name, ByteSource& source, ClientError& err) override;
    bool rename(const std::string& from, const std::string& to, ClientError& err) override;
    bool remove(const std::string& name, ClientError& err) override;

    // "ftp://host:port/%2Fabs/dir/" style URL for a remote path.
    std::string urlFor(const std::string& remotePath, bool isDir) const;

protected:
    // TLS options for FTPS; nothing for plain FTP.
    virtual void applySecurityOptions(CURL* h);

private:
    bool perform(ClientError& err, const std::string& what);
    void resetRequest();
    bool runQuote(const std::vector<std::string>& commands,
                  ClientError& err, const std::string& what);

    CURL* curl_ = nullptr;
    char errbuf_[256] = {};
    std::string host_;
    std::uint16_t port_ = 21;
    std::chrono::milliseconds timeout_{30000};
    std::string user_;
    std::string password_;
    std::string cwd_ = "/";
    bool loggedIn_ = false;
};

class CurlFtpsClient : public CurlFtpClient {
public:
    explicit CurlFtpsClient(bool insecureSkipVerify = false)
        : skipVerify_(insecureSkipVerify) {}

    Protocol protocol() const override { return Protocol::Ftps; }

protected:
    void applySecurityOptions(CURL* h) override;

private:
    bool skipVerify_;
};

} // namespace iftpfm
