// Shared value types: protocols, endpoints, configuration entries and the
// error taxonomy reported by every remote backend.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace iftpfm {

enum class Protocol { Ftp, Ftps, Sftp };

// SSH host key validation policy (SFTP only).
enum class KnownHostsPolicy {
    Strict,    // Requires an exact known_hosts match.
    AcceptNew, // Adds unknown hosts, rejects changed keys.
    Off        // No verification.
};

enum class ErrorKind { None, Connection, Auth, Protocol, Io };

struct ClientError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    explicit operator bool() const { return kind != ErrorKind::None; }
};

const char* protocolName(Protocol p);
const char* errorKindName(ErrorKind k);
bool parseProtocol(const std::string& text, Protocol& out);
bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out);

// Password or key file; exactly one is set for a valid endpoint.
struct Credential {
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    std::optional<std::string> key_passphrase;
};

struct Endpoint {
    std::string host;
    std::uint16_t port = 21;
    Protocol protocol = Protocol::Ftp;
    std::string login;
    Credential credential;
    std::string path;
};

// One source -> destination task. Immutable after load and shared read-only
// between workers.
struct ConfigEntry {
    Endpoint from;
    Endpoint to;
    std::uint64_t min_age_seconds = 0; // 0 disables age filtering
    std::string pattern_text;
    std::shared_ptr<const std::regex> pattern;

    // Unanchored: the pattern may match anywhere in the name.
    bool matches(const std::string& name) const {
        return pattern && std::regex_search(name, *pattern);
    }
};

// Short "proto://host:port/path" form used in log lines.
std::string describeEndpoint(const Endpoint& ep);

// Run-wide backend options.
struct ClientOptions {
    bool insecure_skip_verify = false;
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Off;
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
};

} // namespace iftpfm
