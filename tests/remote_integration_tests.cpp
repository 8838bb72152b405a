// Integration tests for the real FTP, FTPS and SFTP backends against test
// servers. Each protocol runs only when its IFTPFM_IT_<PROTO>_* variables are
// set; with nothing configured the test is skipped (exit code 77).
//
//   IFTPFM_IT_<PROTO>_HOST, _PORT, _USER, _PASS or _KEY (SFTP), _DIR
//   IFTPFM_IT_FTPS_INSECURE=1     accept self-signed certificates
//   IFTPFM_IT_UNROUTABLE_HOST     address that drops SYNs (timeout check)
#include "iftpfm/RemoteClient.hpp"
#include "iftpfm/TransferBuffer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const std::string &key) {
    const char *raw = std::getenv(key.c_str());
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t fallback,
               std::uint16_t &out) {
    if (!raw.has_value()) {
        out = fallback;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

struct ServerConfig {
    iftpfm::Protocol protocol = iftpfm::Protocol::Ftp;
    iftpfm::Endpoint endpoint;
    iftpfm::ClientOptions options;
};

// Reads IFTPFM_IT_<prefix>_*; returns false when the protocol is not set up.
bool loadServer(const std::string &prefix, iftpfm::Protocol protocol,
                std::uint16_t defaultPort, ServerConfig &out, std::string &problem) {
    const std::string base = "IFTPFM_IT_" + prefix + "_";
    const auto host = envValue(base + "HOST");
    const auto user = envValue(base + "USER");
    const auto pass = envValue(base + "PASS");
    const auto key = envValue(base + "KEY");
    if (!host || !user || (!pass && !key))
        return false;

    out.protocol = protocol;
    out.endpoint.protocol = protocol;
    out.endpoint.host = *host;
    out.endpoint.login = *user;
    if (pass)
        out.endpoint.credential.password = *pass;
    else
        out.endpoint.credential.key_path = *key;
    if (const auto phrase = envValue(base + "KEY_PASSPHRASE"))
        out.endpoint.credential.key_passphrase = *phrase;
    out.endpoint.path = envValue(base + "DIR").value_or("");
    if (!parsePort(envValue(base + "PORT"), defaultPort, out.endpoint.port))
        problem = base + "PORT is invalid";
    out.options.known_hosts_policy = iftpfm::KnownHostsPolicy::Off;
    out.options.insecure_skip_verify = envValue("IFTPFM_IT_FTPS_INSECURE").has_value();
    return true;
}

void exerciseServer(TestContext &t, const ServerConfig &cfg) {
    const std::string tag = std::string("[") + iftpfm::protocolName(cfg.protocol) + "] ";
    auto client = iftpfm::makeRemoteClient(cfg.protocol, cfg.options);
    t.check(client && client->protocol() == cfg.protocol, tag + "backend matches protocol");
    if (!client)
        return;

    iftpfm::ClientError err;
    const iftpfm::Endpoint &ep = cfg.endpoint;
    const bool open = client->connect(ep.host, ep.port, std::chrono::seconds(15), err) &&
                      client->login(ep.login, ep.credential, err);
    t.check(open, tag + "connect and login: " + err.message);
    if (!open)
        return;
    t.check(!client->currentDirectory().empty(), tag + "initial directory known");
    if (!ep.path.empty()) {
        t.check(client->changeDirectory(ep.path, err), tag + "cwd: " + err.message);
    }
    t.check(client->setBinaryMode(err), tag + "binary mode: " + err.message);

    const std::string token = uniqueToken();
    const std::string name = "iftpfm-it-" + token + ".txt";
    const std::string moved = "iftpfm-it-" + token + "-moved.txt";
    const std::string payload = "iftpfm integration payload\nline-2\n";

    iftpfm::MemoryTransferBuffer up;
    std::string why;
    up.write(payload.data(), payload.size(), why);
    up.rewind(why);
    err.clear();
    t.check(client->upload(name, up, err), tag + "upload: " + err.message);

    std::uint64_t size = 0;
    t.check(client->size(name, size, err) && size == payload.size(),
            tag + "size matches payload: " + err.message);

    std::int64_t mtime = 0;
    t.check(client->modTime(name, mtime, err) && mtime > 0, tag + "modTime: " + err.message);

    std::vector<std::string> names;
    t.check(client->list(names, err), tag + "list: " + err.message);
    t.check(std::find(names.begin(), names.end(), name) != names.end(),
            tag + "list includes the uploaded file");

    iftpfm::MemoryTransferBuffer down;
    t.check(client->download(name, down, err), tag + "download: " + err.message);
    t.check(std::string(down.bytes().begin(), down.bytes().end()) == payload,
            tag + "downloaded content matches");

    t.check(client->rename(name, moved, err), tag + "rename: " + err.message);
    t.check(!client->size(name, size, err), tag + "old name gone after rename");
    err.clear();
    t.check(client->remove(moved, err), tag + "remove: " + err.message);

    iftpfm::ClientError cleanup;
    client->remove(name, cleanup);
    client->close();
    t.check(!client->isConnected(), tag + "close disconnects");
}

void checkConnectTimeout(TestContext &t, const std::string &host) {
    const auto budget = std::chrono::seconds(3);
    const std::uint16_t ports[] = {21, 21, 22};
    const iftpfm::Protocol protocols[] = {iftpfm::Protocol::Ftp, iftpfm::Protocol::Ftps,
                                          iftpfm::Protocol::Sftp};
    for (int i = 0; i < 3; ++i) {
        const std::string tag = std::string("[timeout ") + iftpfm::protocolName(protocols[i]) + "] ";
        auto client = iftpfm::makeRemoteClient(protocols[i], iftpfm::ClientOptions{});
        iftpfm::Credential cred;
        cred.password = "x";
        iftpfm::ClientError err;
        const auto started = std::chrono::steady_clock::now();
        const bool ok = client->connect(host, ports[i], budget, err) &&
                        client->login("nobody", cred, err);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        t.check(!ok, tag + "unroutable host fails");
        t.check(err.kind == iftpfm::ErrorKind::Connection, tag + "reported as a connection error");
        t.check(elapsed < budget + std::chrono::seconds(2), tag + "gives up near the timeout");
    }
}

} // namespace

int main() {
    TestContext t;
    std::vector<ServerConfig> servers;
    const struct {
        const char *prefix;
        iftpfm::Protocol protocol;
        std::uint16_t port;
    } known[] = {{"FTP", iftpfm::Protocol::Ftp, 21},
                 {"FTPS", iftpfm::Protocol::Ftps, 21},
                 {"SFTP", iftpfm::Protocol::Sftp, 22}};
    for (const auto &k : known) {
        ServerConfig cfg;
        std::string problem;
        if (!loadServer(k.prefix, k.protocol, k.port, cfg, problem))
            continue;
        if (!problem.empty()) {
            std::cerr << "[FAIL] " << problem << "\n";
            return EXIT_FAILURE;
        }
        servers.push_back(cfg);
    }
    const auto unroutable = envValue("IFTPFM_IT_UNROUTABLE_HOST");

    if (servers.empty() && !unroutable) {
        std::cout << "[SKIP] remote_integration_tests requires IFTPFM_IT_FTP_*, "
                  << "IFTPFM_IT_FTPS_*, IFTPFM_IT_SFTP_* (HOST, USER, PASS or KEY) "
                  << "or IFTPFM_IT_UNROUTABLE_HOST\n";
        return kSkipExitCode;
    }

    for (const auto &cfg : servers)
        exerciseServer(t, cfg);
    if (unroutable)
        checkConnectTimeout(t, *unroutable);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] remote_integration_tests\n";
    return EXIT_SUCCESS;
}
