#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace iftpfm {

// In-memory "remote" file system shared by every mock client of one test.
// Several servers are modelled as separate host names.
class MockRemoteFs {
public:
    struct File {
        std::string data;
        std::int64_t mtime = 0;
    };

    // Operations that can be made to fail, per host.
    enum class Fault {
        Connect,
        Login,
        ChangeDirectory,
        List,
        ModTime,
        Size,
        Download,
        Upload,
        Rename,
        Remove,
        ShortUpload, // stores one byte less than sent
        SizeLie      // size() reports one byte more than stored
    };

    void mkdir(const std::string& host, const std::string& dir);
    void put(const std::string& host, const std::string& path,
             const std::string& data, std::int64_t mtime);
    bool exists(const std::string& host, const std::string& path) const;
    std::string read(const std::string& host, const std::string& path) const;
    std::set<std::string> names(const std::string& host, const std::string& dir) const;

    // count < 0: fail forever; otherwise fail the next `count` calls.
    void injectFault(const std::string& host, Fault f, int count = -1,
                     const std::string& onlyName = {});
    bool consumeFault(const std::string& host, Fault f, const std::string& name);

    // Record of mutating calls, e.g. "dst:rename .a.tmp a".
    std::vector<std::string> journal() const;
    void record(const std::string& line);

private:
    friend class MockRemoteClient;
    struct FaultSpec {
        int remaining = -1;
        std::string onlyName;
    };
    mutable std::mutex mtx_;
    std::map<std::string, std::map<std::string, std::map<std::string, File>>> hosts_;
    std::map<std::string, std::set<std::string>> dirs_;
    std::map<std::string, std::map<Fault, FaultSpec>> faults_;
    std::vector<std::string> journal_;
};

class MockRemoteClient : public RemoteClient {
public:
    MockRemoteClient(std::shared_ptr<MockRemoteFs> fs, Protocol p = Protocol::Ftp);

    Protocol protocol() const override { return protocol_; }

    bool connect(const std::string& host,
                 std::uint16_t port,
                 std::chrono::milliseconds timeout,
                 ClientError& err) override;
    bool login(const std::string& user, const Credential& cred, ClientError& err) override;
    bool setBinaryMode(ClientError& err) override;
    void close() override;
    bool isConnected() const override { return connected_; }

    bool changeDirectory(const std::string& path, ClientError& err) override;
    std::string currentDirectory() const override { return cwd_; }

    bool list(std::vector<std::string>& out, ClientError& err) override;
    bool modTime(const std::string& name, std::int64_t& mtime, ClientError& err) override;
    bool size(const std::string& name, std::uint64_t& bytes, ClientError& err) override;
    bool download(const std::string& name, ByteSink& sink, ClientError& err) override;
    bool upload(const std::string& name, ByteSource& source, ClientError& err) override;
    bool rename(const std::string& from, const std::string& to, ClientError& err) override;
    bool remove(const std::string& name, ClientError& err) override;

    bool binaryMode() const { return binary_; }

private:
    bool ready(ClientError& err) const;
    bool fault(MockRemoteFs::Fault f, const std::string& name,
               ErrorKind kind, ClientError& err);

    std::shared_ptr<MockRemoteFs> fs_;
    Protocol protocol_;
    std::string host_;
    std::string cwd_ = "/";
    bool connected_ = false;
    bool loggedIn_ = false;
    bool binary_ = false;
};

} // namespace iftpfm
