#include "iftpfm/CurlFtpClient.hpp"

#include <curl/curl.h>

#include <mutex>

namespace iftpfm {

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { ::curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct SinkContext {
    ByteSink* sink = nullptr;
    std::string error;
};

struct SourceContext {
    ByteSource* source = nullptr;
    std::string error;
};

size_t onBytesReceived(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<SinkContext*>(userdata);
    const size_t len = size * nitems;
    if (!ctx->sink->write(buffer, len, ctx->error))
        return 0; // CURLE_WRITE_ERROR
    return len;
}

size_t onBytesRequested(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<SourceContext*>(userdata);
    const size_t n = ctx->source->read(buffer, size * nitems, ctx->error);
    if (n == 0 && !ctx->error.empty())
        return CURL_READFUNC_ABORT;
    return n;
}

size_t onListing(char* buffer, size_t size, size_t nitems, void* userdata) {
    static_cast<std::string*>(userdata)->append(buffer, size * nitems);
    return size * nitems;
}

ErrorKind classify(CURLcode rc) {
    switch (rc) {
    case CURLE_LOGIN_DENIED:
        return ErrorKind::Auth;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_USE_SSL_FAILED:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_FTP_WEIRD_SERVER_REPLY:
        return ErrorKind::Connection;
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
        return ErrorKind::Io;
    default:
        return ErrorKind::Protocol;
    }
}

std::string baseName(const std::string& entry) {
    const auto slash = entry.find_last_of('/');
    return slash == std::string::npos ? entry : entry.substr(slash + 1);
}

} // namespace

CurlFtpClient::CurlFtpClient() {
    ensureCurlGlobalInit();
}

CurlFtpClient::~CurlFtpClient() {
    close();
}

void CurlFtpClient::applySecurityOptions(CURL*) {}

void CurlFtpsClient::applySecurityOptions(CURL* h) {
    // Explicit FTPS: AUTH TLS on the control port, PROT P on data.
    ::curl_easy_setopt(h, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    ::curl_easy_setopt(h, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    if (skipVerify_) {
        // The handshake still runs; only trust failures are ignored.
        ::curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        ::curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

std::string CurlFtpClient::urlFor(const std::string& remotePath, bool isDir) const {
    // Root-relative form, the same paths CURLOPT_QUOTE commands use.
    std::string path = "/%2f";
    std::size_t start = 0;
    while (start <= remotePath.size()) {
        std::size_t end = remotePath.find('/', start);
        if (end == std::string::npos)
            end = remotePath.size();
        if (end > start) {
            const std::string comp = remotePath.substr(start, end - start);
            char* esc = ::curl_easy_escape(curl_, comp.c_str(), static_cast<int>(comp.size()));
            if (esc) {
                path += esc;
                ::curl_free(esc);
            } else {
                path += comp;
            }
            path += '/';
        }
        start = end + 1;
    }
    if (path.back() == '/')
        path.pop_back();
    // IPv6 literals need brackets in a URL authority.
    const bool literalV6 = host_.find(':') != std::string::npos && host_.front() != '[';
    std::string url = "ftp://" + (literalV6 ? "[" + host_ + "]" : host_) + path;
    if (isDir && url.back() != '/')
        url += '/';
    return url;
}

void CurlFtpClient::resetRequest() {
    ::curl_easy_reset(curl_);
    errbuf_[0] = '\0';
    ::curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_);
    ::curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    ::curl_easy_setopt(curl_, CURLOPT_PORT, static_cast<long>(port_));
    ::curl_easy_setopt(curl_, CURLOPT_USERNAME, user_.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    ::curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    applySecurityOptions(curl_);
}

bool CurlFtpClient::perform(ClientError& err, const std::string& what) {
    const CURLcode rc = ::curl_easy_perform(curl_);
    if (rc == CURLE_OK)
        return true;

    long status = 0;
    ::curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    std::string msg = what + ": " + (errbuf_[0] ? std::string(errbuf_) : ::curl_easy_strerror(rc));
    if (status != 0)
        msg += " (server reply " + std::to_string(status) + ")";
    if (rc == CURLE_OPERATION_TIMEDOUT)
        msg += " [timeout " + std::to_string(timeout_.count()) + " ms]";
    err.set(classify(rc), msg);
    return false;
}

bool CurlFtpClient::runQuote(const std::vector<std::string>& commands,
                             ClientError& err, const std::string& what) {
    struct curl_slist* quote = nullptr;
    for (const auto& c : commands)
        quote = ::curl_slist_append(quote, c.c_str());
    resetRequest();
    const std::string url = urlFor(cwd_, true);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    ::curl_easy_setopt(curl_, CURLOPT_QUOTE, quote);
    const bool ok = perform(err, what);
    ::curl_slist_free_all(quote);
    return ok;
}

bool CurlFtpClient::connect(const std::string& host,
                            std::uint16_t port,
                            std::chrono::milliseconds timeout,
                            ClientError& err) {
    close();
    if (host.empty()) {
        err.set(ErrorKind::Connection, "host is required");
        return false;
    }
    curl_ = ::curl_easy_init();
    if (!curl_) {
        err.set(ErrorKind::Connection, "curl_easy_init failed");
        return false;
    }
    host_ = host;
    port_ = port;
    timeout_ = timeout;
    cwd_ = "/";
    return true;
}

bool CurlFtpClient::login(const std::string& user, const Credential& cred, ClientError& err) {
    if (!curl_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    if (!cred.password) {
        err.set(ErrorKind::Auth, "password is required for " + std::string(protocolName(protocol())));
        return false;
    }
    user_ = user;
    password_ = *cred.password;

    resetRequest();
    const std::string url = urlFor("/", true);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    // Bounds the whole first round-trip: TCP, greeting, TLS, USER/PASS.
    ::curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    if (!perform(err, "connect to " + host_ + ":" + std::to_string(port_)))
        return false;

    const char* home = nullptr;
    if (::curl_easy_getinfo(curl_, CURLINFO_FTP_ENTRY_PATH, &home) == CURLE_OK && home && *home == '/')
        cwd_ = home;
    loggedIn_ = true;
    return true;
}

bool CurlFtpClient::setBinaryMode(ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    // libcurl sends TYPE I before every transfer unless TRANSFERTEXT is set.
    return true;
}

void CurlFtpClient::close() {
    if (curl_) {
        ::curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    loggedIn_ = false;
}

bool CurlFtpClient::changeDirectory(const std::string& path, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string target = joinRemotePath(cwd_, path);
    resetRequest();
    const std::string url = urlFor(target, true);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err, "CWD " + target))
        return false;
    cwd_ = target;
    return true;
}

bool CurlFtpClient::list(std::vector<std::string>& out, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    std::string raw;
    resetRequest();
    const std::string url = urlFor(cwd_, true);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    ::curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, onListing);
    ::curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &raw);
    if (!perform(err, "NLST " + cwd_))
        return false;

    out.clear();
    std::size_t start = 0;
    while (start < raw.size()) {
        std::size_t end = raw.find('\n', start);
        if (end == std::string::npos)
            end = raw.size();
        std::string line = raw.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        const std::string name = baseName(line);
        if (!name.empty() && name != "." && name != "..")
            out.push_back(name);
        start = end + 1;
    }
    return true;
}

bool CurlFtpClient::modTime(const std::string& name, std::int64_t& mtime, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = joinRemotePath(cwd_, name);
    resetRequest();
    const std::string url = urlFor(path, false);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    ::curl_easy_setopt(curl_, CURLOPT_FILETIME, 1L);
    if (!perform(err, "MDTM " + path))
        return false;
    curl_off_t t = -1;
    if (::curl_easy_getinfo(curl_, CURLINFO_FILETIME_T, &t) != CURLE_OK || t < 0) {
        err.set(ErrorKind::Protocol, "MDTM " + path + ": modification time not available");
        return false;
    }
    mtime = static_cast<std::int64_t>(t);
    return true;
}

bool CurlFtpClient::size(const std::string& name, std::uint64_t& bytes, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = joinRemotePath(cwd_, name);
    resetRequest();
    const std::string url = urlFor(path, false);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err, "SIZE " + path))
        return false;
    curl_off_t len = -1;
    if (::curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK || len < 0) {
        err.set(ErrorKind::Protocol, "SIZE " + path + ": size not available");
        return false;
    }
    bytes = static_cast<std::uint64_t>(len);
    return true;
}

bool CurlFtpClient::download(const std::string& name, ByteSink& sink, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = joinRemotePath(cwd_, name);
    SinkContext ctx;
    ctx.sink = &sink;
    resetRequest();
    const std::string url = urlFor(path, false);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, onBytesReceived);
    ::curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &ctx);
    if (!perform(err, "RETR " + path)) {
        if (!ctx.error.empty())
            err.set(ErrorKind::Io, "RETR " + path + ": local write failed: " + ctx.error);
        return false;
    }
    return true;
}

bool CurlFtpClient::upload(const std::string& name, ByteSource& source, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = joinRemotePath(cwd_, name);
    SourceContext ctx;
    ctx.source = &source;
    resetRequest();
    const std::string url = urlFor(path, false);
    ::curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    ::curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(source.size()));
    ::curl_easy_setopt(curl_, CURLOPT_READFUNCTION, onBytesRequested);
    ::curl_easy_setopt(curl_, CURLOPT_READDATA, &ctx);
    if (!perform(err, "STOR " + path)) {
        if (!ctx.error.empty())
            err.set(ErrorKind::Io, "STOR " + path + ": local read failed: " + ctx.error);
        return false;
    }
    return true;
}

bool CurlFtpClient::rename(const std::string& from, const std::string& to, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string src = joinRemotePath(cwd_, from);
    const std::string dst = joinRemotePath(cwd_, to);
    return runQuote({"RNFR " + src, "RNTO " + dst}, err, "RNFR/RNTO " + src + " -> " + dst);
}

bool CurlFtpClient::remove(const std::string& name, ClientError& err) {
    if (!loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = joinRemotePath(cwd_, name);
    return runQuote({"DELE " + path}, err, "DELE " + path);
}

} // namespace iftpfm
