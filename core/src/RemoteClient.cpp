#include "iftpfm/RemoteClient.hpp"
#include "iftpfm/CurlFtpClient.hpp"
#include "iftpfm/Libssh2SftpClient.hpp"

namespace iftpfm {

std::unique_ptr<RemoteClient> makeRemoteClient(Protocol p, const ClientOptions& opt) {
    switch (p) {
    case Protocol::Ftp:
        return std::make_unique<CurlFtpClient>();
    case Protocol::Ftps:
        return std::make_unique<CurlFtpsClient>(opt.insecure_skip_verify);
    case Protocol::Sftp:
        return std::make_unique<Libssh2SftpClient>(opt);
    }
    return nullptr;
}

ClientFactory defaultClientFactory(const ClientOptions& opt) {
    return [opt](Protocol p) { return makeRemoteClient(p, opt); };
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (!name.empty() && name.front() == '/')
        return name;
    if (dir.empty())
        return name;
    std::string base = dir;
    while (base.size() > 1 && base.back() == '/')
        base.pop_back();
    if (base == "/")
        return "/" + name;
    return base + "/" + name;
}

} // namespace iftpfm
