// libssh2 backend: TCP socket, SSH session and SFTP channel, plus the
// pseudo working directory SFTP lacks.
#include "iftpfm/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace iftpfm {

namespace {

void ensureLibssh2Init() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

// Answers every keyboard-interactive prompt with the password.
struct KbdIntCtx {
    const char* pass;
};

void kbintPasswordCallback(const char*, int, const char*, int,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT*,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                           void** abstract) {
    const KbdIntCtx* ctx = (abstract && *abstract) ? static_cast<const KbdIntCtx*>(*abstract) : nullptr;
    const char* pass = ctx ? ctx->pass : nullptr;
    const size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0)
            continue;
        // libssh2 frees the responses with its own allocator (default: free).
        char* buf = static_cast<char*>(std::malloc(plen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(plen);
    }
}

long remainingMs(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<long>(left.count()) : 0;
}

std::string timeoutText(std::chrono::milliseconds timeout) {
    return "timed out after " + std::to_string(timeout.count()) + " ms";
}

const char* sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FAILURE:
        return "failure";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such path";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        return "no space on filesystem";
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "quota exceeded";
    default:
        return "error";
    }
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient(ClientOptions opt) : opt_(std::move(opt)) {
    ensureLibssh2Init();
}

Libssh2SftpClient::~Libssh2SftpClient() {
    close();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, std::uint16_t port,
                                   std::chrono::steady_clock::time_point deadline,
                                   std::chrono::milliseconds timeout, ClientError& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connection, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    std::string lastError = "no usable address";
    bool timedOut = false;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (s == -1) {
            lastError = std::strerror(errno);
            continue;
        }
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the caller's deadline applies.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            do {
                rc = ::poll(&pfd, 1, static_cast<int>(remainingMs(deadline)));
            } while (rc < 0 && errno == EINTR);
            if (rc == 0) {
                timedOut = true;
                ::close(s);
                break;
            }
            int soerr = 0;
            socklen_t len = sizeof(soerr);
            if (rc > 0 && ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len) == 0 && soerr == 0) {
                rc = 0;
            } else {
                lastError = std::strerror(soerr ? soerr : errno);
                rc = -1;
            }
        } else if (rc != 0) {
            lastError = std::strerror(errno);
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
        if (remainingMs(deadline) == 0) {
            timedOut = true;
            break;
        }
    }
    ::freeaddrinfo(res);
    if (timedOut) {
        err.set(ErrorKind::Connection,
                "connect to " + host + ":" + std::to_string(port) + " " + timeoutText(timeout));
    } else {
        err.set(ErrorKind::Connection,
                "connect to " + host + ":" + std::to_string(port) + " failed: " + lastError);
    }
    return false;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_)
        return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string("unknown error");
}

void Libssh2SftpClient::sftpFailure(ClientError& err, const std::string& what,
                                    const std::string& path) const {
    const int sessionErr = session_ ? libssh2_session_last_errno(session_) : 0;
    if (sessionErr == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long code = libssh2_sftp_last_error(sftp_);
        err.set(ErrorKind::Protocol, what + " " + path + ": " + sftpStatusText(code) +
                                         " (SFTP status " + std::to_string(code) + ")");
        return;
    }
    const bool transport = sessionErr == LIBSSH2_ERROR_SOCKET_SEND ||
                           sessionErr == LIBSSH2_ERROR_SOCKET_RECV ||
                           sessionErr == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
                           sessionErr == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
                           sessionErr == LIBSSH2_ERROR_TIMEOUT;
    err.set(transport ? ErrorKind::Connection : ErrorKind::Protocol,
            what + " " + path + ": " + lastSessionError());
}

bool Libssh2SftpClient::verifyHostKey(ClientError& err) {
    if (opt_.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Connection, "cannot initialise known_hosts");
        return false;
    }

    std::string khPath;
    if (opt_.known_hosts_path.has_value()) {
        khPath = *opt_.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt_.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Connection, "known_hosts missing or unreadable (strict policy): " + khPath);
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Connection, "cannot obtain host key");
        return false;
    }

    int alg = 0;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        break;
#endif
    default:
        alg = 0;
        break;
    }

    const int typemaskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemaskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, host_.c_str(), port_, hostkey, keylen,
                                         typemaskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, host_.c_str(), port_, hostkey, keylen,
                                         typemaskHash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (opt_.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Connection, "known_hosts path not defined");
            return false;
        }
        // Non-default ports are stored as "[host]:port".
        const std::string entry =
            port_ == 22 ? host_ : "[" + host_ + "]:" + std::to_string(port_);
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, entry.c_str(), nullptr, hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Connection, "cannot add host to " + khPath);
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }
    libssh2_knownhost_free(nh);
    err.set(ErrorKind::Connection,
            check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                ? "host key for " + host_ + " does not match known_hosts"
                : "host " + host_ + " not found in known_hosts");
    return false;
}

bool Libssh2SftpClient::connect(const std::string& host,
                                std::uint16_t port,
                                std::chrono::milliseconds timeout,
                                ClientError& err) {
    close();
    if (host.empty()) {
        err.set(ErrorKind::Connection, "host is required");
        return false;
    }
    host_ = host;
    port_ = port;
    cwd_ = "/";
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!tcpConnect(host, port, deadline, timeout, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Connection, "libssh2_session_init failed");
        close();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    const long budget = remainingMs(deadline);
    if (budget == 0) {
        err.set(ErrorKind::Connection, "SSH handshake with " + host + " " + timeoutText(timeout));
        close();
        return false;
    }
    libssh2_session_set_timeout(session_, budget);
    const int rc = libssh2_session_handshake(session_, sock_);
    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_TIMEOUT)
            err.set(ErrorKind::Connection, "SSH handshake with " + host + " " + timeoutText(timeout));
        else
            err.set(ErrorKind::Connection, "SSH handshake with " + host + " failed: " + lastSessionError());
        close();
        return false;
    }
    // Only the handshake is bounded.
    libssh2_session_set_timeout(session_, 0);
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(err)) {
        close();
        return false;
    }
    return true;
}

bool Libssh2SftpClient::login(const std::string& user, const Credential& cred, ClientError& err) {
    if (!session_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }

    if (cred.key_path.has_value()) {
        const char* passphrase = cred.key_passphrase ? cred.key_passphrase->c_str() : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                           cred.key_path->c_str(), passphrase);
        if (rc != 0) {
            err.set(ErrorKind::Auth, "public key authentication as " + user + " failed: " +
                                         lastSessionError());
            return false;
        }
    } else if (cred.password.has_value()) {
        int rcPw = libssh2_userauth_password(session_, user.c_str(), cred.password->c_str());
        if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT || rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
            rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::Connection, "server closed the connection during authentication");
            return false;
        }
        if (rcPw != 0) {
            const std::string pwError = lastSessionError();
            char* methods = libssh2_userauth_list(session_, user.c_str(),
                                                  static_cast<unsigned>(user.size()));
            const std::string authlist = methods ? std::string(methods) : std::string();
            int rcKbd = -1;
            if (authlist.find("keyboard-interactive") != std::string::npos) {
                KbdIntCtx ctx{cred.password->c_str()};
                void** abs = libssh2_session_abstract(session_);
                if (abs)
                    *abs = &ctx;
                rcKbd = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                              kbintPasswordCallback);
                if (abs)
                    *abs = nullptr;
            }
            if (rcKbd != 0) {
                err.set(ErrorKind::Auth,
                        "password authentication as " + user + " failed: " + pwError +
                            (authlist.empty() ? std::string() : " (server offers: " + authlist + ")"));
                return false;
            }
        }
    } else {
        err.set(ErrorKind::Auth, "no password or key file for " + user);
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorKind::Protocol, "SFTP subsystem unavailable: " + lastSessionError());
        return false;
    }

    // Relative configured paths resolve against the login directory.
    char home[1024];
    const int n = libssh2_sftp_realpath(sftp_, ".", home, sizeof(home));
    if (n > 0 && home[0] == '/')
        cwd_.assign(home, static_cast<size_t>(n));
    return true;
}

bool Libssh2SftpClient::setBinaryMode(ClientError& err) {
    // SFTP transfers are always binary.
    return requireSftp(err);
}

void Libssh2SftpClient::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

bool Libssh2SftpClient::requireSftp(ClientError& err) const {
    if (!session_ || !sftp_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::changeDirectory(const std::string& path, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string target = joinRemotePath(cwd_, path);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, target.c_str(), static_cast<unsigned>(target.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        sftpFailure(err, "cd", target);
        return false;
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        (st.permissions & LIBSSH2_SFTP_S_IFMT) != LIBSSH2_SFTP_S_IFDIR) {
        err.set(ErrorKind::Protocol, "cd " + target + ": not a directory");
        return false;
    }
    cwd_ = target;
    return true;
}

bool Libssh2SftpClient::list(std::vector<std::string>& out, ClientError& err) {
    if (!requireSftp(err))
        return false;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, cwd_.c_str());
    if (!dir) {
        sftpFailure(err, "opendir", cwd_);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            std::string name(filename, static_cast<size_t>(rc));
            if (name == "." || name == "..")
                continue;
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                (attrs.permissions & LIBSSH2_SFTP_S_IFMT) != LIBSSH2_SFTP_S_IFREG)
                continue;
            out.push_back(std::move(name));
        } else if (rc == 0) {
            break;
        } else {
            sftpFailure(err, "readdir", cwd_);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::modTime(const std::string& name, std::int64_t& mtime, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string path = fullPath(name);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        sftpFailure(err, "stat", path);
        return false;
    }
    if (!(st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)) {
        err.set(ErrorKind::Protocol, "stat " + path + ": server did not report mtime");
        return false;
    }
    mtime = static_cast<std::int64_t>(st.mtime);
    return true;
}

bool Libssh2SftpClient::size(const std::string& name, std::uint64_t& bytes, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string path = fullPath(name);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        sftpFailure(err, "stat", path);
        return false;
    }
    if (!(st.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        err.set(ErrorKind::Protocol, "stat " + path + ": server did not report size");
        return false;
    }
    bytes = static_cast<std::uint64_t>(st.filesize);
    return true;
}

bool Libssh2SftpClient::download(const std::string& name, ByteSink& sink, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string path = fullPath(name);
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, path.c_str(),
                                                   static_cast<unsigned>(path.size()),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        sftpFailure(err, "open", path);
        return false;
    }
    std::vector<char> buf(256 * 1024);
    std::string why;
    bool ok = true;
    for (;;) {
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (!sink.write(buf.data(), static_cast<size_t>(n), why)) {
                err.set(ErrorKind::Io, "read " + path + ": local write failed: " + why);
                ok = false;
                break;
            }
        } else if (n == 0) {
            break;
        } else {
            sftpFailure(err, "read", path);
            ok = false;
            break;
        }
    }
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2SftpClient::upload(const std::string& name, ByteSource& source, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string path = fullPath(name);
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, path.c_str(),
                                                   static_cast<unsigned>(path.size()), flags,
                                                   LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                                       LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
                                                   LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        sftpFailure(err, "open", path);
        return false;
    }
    std::vector<char> buf(256 * 1024);
    std::string why;
    bool ok = true;
    while (ok) {
        const size_t n = source.read(buf.data(), buf.size(), why);
        if (n == 0) {
            if (!why.empty()) {
                err.set(ErrorKind::Io, "write " + path + ": local read failed: " + why);
                ok = false;
            }
            break;
        }
        const char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                sftpFailure(err, "write", path);
                ok = false;
                break;
            }
            p += w;
            remain -= static_cast<size_t>(w);
        }
    }
    if (libssh2_sftp_close(wh) != 0 && ok) {
        sftpFailure(err, "close", path);
        ok = false;
    }
    return ok;
}

bool Libssh2SftpClient::rename(const std::string& from, const std::string& to, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string src = fullPath(from);
    const std::string dst = fullPath(to);
    // No OVERWRITE flag: an existing target fails and the caller decides.
    const long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    const int rc = libssh2_sftp_rename_ex(sftp_, src.c_str(), static_cast<unsigned>(src.size()),
                                          dst.c_str(), static_cast<unsigned>(dst.size()), flags);
    if (rc != 0) {
        sftpFailure(err, "rename " + src + " ->", dst);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::remove(const std::string& name, ClientError& err) {
    if (!requireSftp(err))
        return false;
    const std::string path = fullPath(name);
    if (libssh2_sftp_unlink(sftp_, path.c_str()) != 0) {
        sftpFailure(err, "unlink", path);
        return false;
    }
    return true;
}

} // namespace iftpfm
