#include "iftpfm/TransferTypes.hpp"

#include <algorithm>
#include <cctype>

namespace iftpfm {

namespace {

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

const char* protocolName(Protocol p) {
    switch (p) {
    case Protocol::Ftp:
        return "ftp";
    case Protocol::Ftps:
        return "ftps";
    case Protocol::Sftp:
        return "sftp";
    }
    return "?";
}

const char* errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Connection:
        return "ConnectionError";
    case ErrorKind::Auth:
        return "AuthError";
    case ErrorKind::Protocol:
        return "ProtocolError";
    case ErrorKind::Io:
        return "IoError";
    }
    return "UnknownError";
}

bool parseProtocol(const std::string& text, Protocol& out) {
    const std::string v = lowered(text);
    if (v == "ftp") {
        out = Protocol::Ftp;
    } else if (v == "ftps") {
        out = Protocol::Ftps;
    } else if (v == "sftp") {
        out = Protocol::Sftp;
    } else {
        return false;
    }
    return true;
}

bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out) {
    const std::string v = lowered(text);
    if (v == "strict") {
        out = KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew") {
        out = KnownHostsPolicy::AcceptNew;
    } else if (v == "off" || v == "no") {
        out = KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

std::string describeEndpoint(const Endpoint& ep) {
    std::string s = protocolName(ep.protocol);
    s += "://";
    s += ep.host;
    s += ':';
    s += std::to_string(ep.port);
    if (ep.path.empty() || ep.path.front() != '/')
        s += '/';
    s += ep.path;
    return s;
}

} // namespace iftpfm
